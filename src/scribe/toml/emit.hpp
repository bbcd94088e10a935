#pragma once

#include <scribe/value.hpp>

#include <string>

namespace scribe {

/**
 * @brief Emit a value as a TOML document.
 *
 * The root must be a mapping. Key order is kept within each group that TOML allows: plain keys
 * come before the sub-tables of their table, and sequences of mappings are written as arrays of
 * tables. Null values have no TOML form: they throw e_unrepresentable with the e_value_path of the
 * offending value.
 */
std::string emit_toml(const value&);

}  // namespace scribe
