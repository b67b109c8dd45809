#pragma once

#include "profile/connection_profile.hpp"

#include <nlohmann/json.hpp>

namespace kafkasec {

inline constexpr const char* kRedacted = "***";

/**
 * @brief Render a profile for display.
 *
 * Passwords, the key passphrase and private key material are replaced by
 * kRedacted. Certificates are summarised by file and byte count.
 */
[[nodiscard]] nlohmann::json profile_to_json(const ConnectionProfile& profile);

} // namespace kafkasec
