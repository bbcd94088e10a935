#pragma once

#include <scribe/value.hpp>

#include <string>

namespace scribe {

/**
 * @brief Emit a value as compact JSON: no insignificant whitespace and no trailing newline.
 *
 * Mapping keys are written in their stored order. Non-finite floats and strings that are not
 * valid UTF-8 can't be written, and throw e_unrepresentable.
 */
std::string emit_json(const value&);

}  // namespace scribe
