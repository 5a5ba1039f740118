#pragma once

#include <string>

namespace semver {

/**
 * @brief A message intended to be shown to a human explaining an error
 */
struct e_human_message {
    std::string value;
};

}  // namespace semver
