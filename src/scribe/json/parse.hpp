#pragma once

#include <scribe/value.hpp>

#include <string_view>

namespace scribe {

/**
 * @brief Parse a JSON document (RFC 8259). Comments and trailing commas are rejected.
 *
 * On failure, throws with e_parse_error, e_byte_offset, and e_source_position.
 */
value parse_json(std::string_view content);

}  // namespace scribe
