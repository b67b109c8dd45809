#pragma once

#include "core/error.hpp"
#include "crypto/pem.hpp"

#include <string>
#include <string_view>

namespace kafkasec {

/**
 * @brief True if the block carries the legacy RFC 1421 encryption headers
 * ("Proc-Type: 4,ENCRYPTED" / "DEK-Info: <cipher>,<iv>").
 */
[[nodiscard]] bool is_encrypted(const PemBlock& block);

/**
 * @brief Return the private key in `key_bytes` as PEM, decrypting it first if
 * it uses legacy PEM encryption.
 *
 * Legacy PEM encryption is kept only so that already deployed key files keep
 * working. New deployments should keep the key unencrypted on disk and
 * protect it through a secrets store instead.
 *
 * @param key_bytes  Raw contents of the key file
 * @param passphrase Used only as decryption input; an empty passphrase never
 *                   opens an encrypted key
 * @return Unencrypted input unchanged, or the decrypted key re-encoded under
 *         the original block type. PARSE_ERROR if no PEM block is present,
 *         DECRYPTION_ERROR (with the OpenSSL cause) if decryption fails.
 */
[[nodiscard]] Result<std::string> decrypt_private_key(std::string_view key_bytes,
                                                      const std::string& passphrase);

} // namespace kafkasec
