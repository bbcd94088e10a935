#pragma once

#include <scribe/value.hpp>

#include <nlohmann/json_fwd.hpp>

namespace scribe {

/**
 * @brief Convert a parsed JSON document into a scribe value.
 *
 * Integers that fit in a signed 64-bit integer become integers. Everything else numeric
 * (including unsigned integers too large for int64) becomes a float. Conversion recurses once
 * per level of nesting: parse_json() rejects documents deeper than max_nesting_depth first.
 */
value nlohmann_json_as_value(const nlohmann::ordered_json&) noexcept;

/**
 * @brief Convert a scribe value into a JSON document.
 *
 * Throws e_unrepresentable (with e_value_path) if the value holds a non-finite float.
 */
nlohmann::ordered_json value_as_nlohmann_json(const value&);

}  // namespace scribe
