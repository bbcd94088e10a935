#pragma once

#include <scribe/value.hpp>

#include <string>

namespace scribe {

/**
 * @brief Emit a value as a block-style YAML document, ending with a newline.
 *
 * Strings that a YAML reader would type as something else (`"true"`, `"12"`, `"null"`, and the
 * YAML 1.1 booleans such as `"yes"`) are quoted, both as values and as mapping keys. Empty
 * containers are written in flow style.
 */
std::string emit_yaml(const value&);

}  // namespace scribe
