#pragma once

#include <scribe/value.hpp>

#include <yaml-cpp/node/node.h>

#include <string_view>

namespace scribe {

/**
 * @brief Parse a single YAML document into a yaml-cpp node.
 *
 * An empty stream gives a null node. A stream holding more than one document is an
 * e_unsupported_feature error. Syntax errors (including tabs used for indentation) throw
 * e_parse_error with e_source_position.
 */
YAML::Node parse_yaml_node(std::string_view content);

/**
 * @brief Parse a YAML document into a value
 */
value parse_yaml(std::string_view content);

}  // namespace scribe
