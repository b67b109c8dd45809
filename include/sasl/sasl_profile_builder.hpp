#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "sasl/sasl_profile.hpp"

namespace kafkasec {

/**
 * @brief Assemble the SASL part of a connection profile.
 *
 * Disabled settings yield a disabled profile. When enabled, username,
 * password and handshake are copied verbatim and the mechanism string is
 * resolved to the closed SaslMechanism set. An unknown mechanism or GSSAPI
 * auth type is a CONFIG_ERROR.
 *
 * GSSAPI takes its username from the SASL username and its password from
 * the SASL password, falling back to the GSSAPI password only when the SASL
 * password is empty.
 */
[[nodiscard]] Result<SaslProfile> build_sasl(const SaslSettings& settings);

} // namespace kafkasec
