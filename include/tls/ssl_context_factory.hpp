#pragma once

#include "core/error.hpp"
#include "crypto/openssl_types.hpp"
#include "tls/tls_profile.hpp"

namespace kafkasec {

/**
 * @brief Build an OpenSSL client context from a TLS profile.
 *
 * - Minimum protocol TLS 1.2
 * - Trust store from the profile, or the system default paths if empty
 * - Client certificate chain and key if the profile carries a pair
 * - SSL_VERIFY_PEER unless insecure_skip_verify is set
 *
 * @return Owned SSL_CTX, CONFIG_ERROR for a disabled profile,
 *         PAIR_MISMATCH_ERROR / PARSE_ERROR if OpenSSL rejects the material.
 */
[[nodiscard]] Result<SslCtxPtr> make_client_ssl_context(const TlsProfile& profile);

} // namespace kafkasec
