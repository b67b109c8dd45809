#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "tls/tls_profile.hpp"

#include <string>
#include <vector>

namespace kafkasec {

/**
 * @brief Read a CA bundle and return its certificates, one PEM string each.
 *
 * Non-certificate blocks are skipped. An unreadable file is a
 * FILE_ACCESS_ERROR; a malformed block is a PARSE_ERROR.
 *
 * A file that holds no certificate at all (empty, or only keys) is also a
 * PARSE_ERROR even though the CA file format itself allows zero
 * certificates. An empty trust store means "use the system roots"
 * (TlsProfile::uses_system_trust()), so accepting such a file would
 * silently widen trust instead of pinning the configured CA.
 */
[[nodiscard]] Result<std::vector<std::string>> load_ca_bundle(const std::string& ca_path);

/**
 * @brief Assemble the TLS part of a connection profile.
 *
 * Disabled settings yield a disabled profile without touching the
 * filesystem. When enabled, a configured cert or key path is handed to
 * load_pair(), which reports a missing half of the pair itself.
 */
[[nodiscard]] Result<TlsProfile> build_tls(const TlsSettings& settings);

} // namespace kafkasec
