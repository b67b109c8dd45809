#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "profile/connection_profile.hpp"

namespace kafkasec {

/**
 * @brief Turns declarative connection settings into a ConnectionProfile.
 *
 * Steps run in a fixed order and the first failure is returned as is:
 * version, TLS, SASL, then the structural check. Nothing is retried and no
 * partial profile is handed out. The builder is stateless, so building the
 * same config twice over unchanged files yields equal profiles.
 */
class ConnectionProfileBuilder {
public:
    [[nodiscard]] static Result<ConnectionProfile> build(const ConnectionConfig& config);
};

} // namespace kafkasec
