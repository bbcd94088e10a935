#pragma once

#include <scribe/value.hpp>

#include <optional>
#include <string_view>

namespace scribe {

/**
 * @brief Resolve the type of an untagged plain YAML scalar using the YAML 1.2 core schema.
 *
 * - `null`, `Null`, `NULL`, `~`, and the empty string are null
 * - `true` and `false` (in lower, title, or upper case) are booleans
 * - decimal, `0o` octal, and `0x` hexadecimal integers are integers. Integers that do not fit in
 *   64 bits become floats.
 * - decimal floats, `.inf`, `-.inf`, and `.nan` are floats
 * - Anything else is a string
 */
value resolve_plain_scalar(std::string_view spelling);

/**
 * @brief Parse a core schema integer. Returns a float value if the integer overflows, or nullopt
 * if the spelling is not an integer.
 */
std::optional<value> parse_core_integer(std::string_view spelling) noexcept;

/**
 * @brief Parse a core schema float (including the inf and nan spellings)
 */
std::optional<double> parse_core_float(std::string_view spelling) noexcept;

/**
 * @brief Determine whether a plain scalar would be read as a boolean by a YAML 1.1 reader but
 * not by the core schema (e.g. `yes`, `Off`, `n`)
 */
bool is_yaml11_bool_spelling(std::string_view spelling) noexcept;

}  // namespace scribe
