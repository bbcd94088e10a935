#pragma once

#include <string>

namespace scribe {

/**
 * @brief The YAML tag of the node that was being converted when an error occurred
 */
struct e_yaml_tag {
    std::string value;
};

}  // namespace scribe
