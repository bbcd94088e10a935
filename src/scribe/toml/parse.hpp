#pragma once

#include <scribe/value.hpp>

#include <string_view>

namespace scribe {

/**
 * @brief Parse a TOML 1.0 document. The result is always a mapping.
 *
 * Syntax errors (including duplicate keys and redefined tables) throw e_parse_error. Dates and
 * times have no value representation, and throw e_unsupported_feature.
 */
value parse_toml(std::string_view content);

}  // namespace scribe
