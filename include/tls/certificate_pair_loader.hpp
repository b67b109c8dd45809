#pragma once

#include "core/error.hpp"

#include <string>

namespace kafkasec {

/**
 * @brief Client certificate bound to its matching private key, both PEM.
 *
 * Only load_pair() creates one, and only after both files were readable and
 * the key was verified against the certificate, so a pair is never partial.
 */
class CertificateKeyPair {
public:
    /// Certificate file contents, byte-for-byte (may hold a chain)
    [[nodiscard]] const std::string& certificate_pem() const { return certificate_pem_; }

    /// Key file contents, or the decrypted key re-encoded if the file was encrypted
    [[nodiscard]] const std::string& private_key_pem() const { return private_key_pem_; }

    [[nodiscard]] const std::string& cert_file() const { return cert_file_; }
    [[nodiscard]] const std::string& key_file() const { return key_file_; }

    /// True if the key file used legacy PEM encryption
    [[nodiscard]] bool key_was_encrypted() const { return key_was_encrypted_; }

    bool operator==(const CertificateKeyPair&) const = default;

private:
    friend Result<CertificateKeyPair> load_pair(const std::string&, const std::string&,
                                                const std::string&);

    CertificateKeyPair(std::string cert_file, std::string key_file,
                       std::string certificate_pem, std::string private_key_pem,
                       bool key_was_encrypted)
        : certificate_pem_(std::move(certificate_pem)),
          private_key_pem_(std::move(private_key_pem)),
          cert_file_(std::move(cert_file)),
          key_file_(std::move(key_file)),
          key_was_encrypted_(key_was_encrypted) {}

    std::string certificate_pem_;
    std::string private_key_pem_;
    std::string cert_file_;
    std::string key_file_;
    bool key_was_encrypted_ = false;
};

/**
 * @brief Check that both halves of a client pair can be read.
 *
 * FILE_ACCESS_ERROR "cannot read key and certificate" if neither is
 * readable. If only one side fails, the message names that side alone (its
 * path, or "path is empty" when none was given) and states that certificate
 * and key must be supplied as a pair.
 */
[[nodiscard]] Result<bool> check_pair_readable(const std::string& cert_path,
                                               const std::string& key_path);

/**
 * @brief Load a client certificate and key, decrypting the key if needed.
 *
 * Errors:
 * - FILE_ACCESS_ERROR from check_pair_readable().
 * - PARSE_ERROR / DECRYPTION_ERROR from the key decryption step.
 * - PAIR_MISMATCH_ERROR if either side is malformed or they do not match.
 */
[[nodiscard]] Result<CertificateKeyPair> load_pair(const std::string& cert_path,
                                                   const std::string& key_path,
                                                   const std::string& passphrase);

} // namespace kafkasec
