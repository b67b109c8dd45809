#pragma once

#include "profile/connection_profile.hpp"

#include <string>
#include <vector>

namespace kafkasec {

/**
 * @brief Structural checks over an assembled profile, mirroring the Kafka
 * client library's own sanity check.
 * @return One message per problem, empty if the profile is usable
 */
[[nodiscard]] std::vector<std::string> validate_profile(const ConnectionProfile& profile);

} // namespace kafkasec
