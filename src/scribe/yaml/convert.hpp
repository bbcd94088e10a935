#pragma once

#include <scribe/value.hpp>

#include <yaml-cpp/node/node.h>

namespace scribe {

/**
 * @brief Convert a yaml-cpp node tree into a value.
 *
 * Untagged plain scalars are typed with the YAML 1.2 core schema. Aliases are expanded, but an
 * alias to one of its own ancestors is an e_unsupported_feature error.
 */
value yaml_as_value(const YAML::Node&);

}  // namespace scribe
