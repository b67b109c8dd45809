#pragma once

#include "sasl/sasl_mechanism.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kafkasec {

struct ScramCredentials {
    std::string username;
    std::string password;
};

/**
 * @brief Client-side SCRAM primitives (RFC 5802) for one hash function.
 *
 * Handed to the protocol layer that performs the challenge/response
 * exchange; nothing here talks to a broker.
 */
class ScramClient {
public:
    ScramClient(const EVP_MD* md, ScramCredentials credentials);

    [[nodiscard]] const std::string& username() const { return credentials_.username; }
    [[nodiscard]] size_t digest_size() const;

    // H(data)
    [[nodiscard]] std::vector<uint8_t> digest(const std::vector<uint8_t>& data) const;
    [[nodiscard]] std::vector<uint8_t> digest(std::string_view data) const;

    // HMAC(key, message)
    [[nodiscard]] std::vector<uint8_t> hmac(const std::vector<uint8_t>& key,
                                            std::string_view message) const;

    // SaltedPassword = Hi(password, salt, iterations)
    [[nodiscard]] std::vector<uint8_t> salted_password(const std::vector<uint8_t>& salt,
                                                       uint32_t iterations) const;

    // ClientKey = HMAC(SaltedPassword, "Client Key")
    [[nodiscard]] std::vector<uint8_t> client_key(const std::vector<uint8_t>& salted_pw) const;

    // ServerKey = HMAC(SaltedPassword, "Server Key")
    [[nodiscard]] std::vector<uint8_t> server_key(const std::vector<uint8_t>& salted_pw) const;

    // StoredKey = H(ClientKey)
    [[nodiscard]] std::vector<uint8_t> stored_key(const std::vector<uint8_t>& client_key_val) const;

    // ClientProof = ClientKey XOR HMAC(StoredKey, AuthMessage)
    [[nodiscard]] std::vector<uint8_t> client_proof(const std::vector<uint8_t>& salted_pw,
                                                    std::string_view auth_message) const;

    // ServerSignature == HMAC(ServerKey, AuthMessage)
    [[nodiscard]] bool verify_server_signature(const std::vector<uint8_t>& salted_pw,
                                               std::string_view auth_message,
                                               const std::vector<uint8_t>& signature) const;

    // XOR two byte vectors of equal length
    [[nodiscard]] static std::vector<uint8_t> xor_bytes(const std::vector<uint8_t>& a,
                                                        const std::vector<uint8_t>& b);

private:
    const EVP_MD* md_;
    ScramCredentials credentials_;
};

/**
 * @brief Stateless SCRAM credential-generator selection.
 *
 * The profile carries one of these for SCRAM mechanisms; the protocol layer
 * calls new_client() when it opens a connection.
 */
class IScramMechanism {
public:
    virtual ~IScramMechanism() = default;

    /// "SCRAM-SHA-256" or "SCRAM-SHA-512"
    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Output length of the bound hash in bytes
    [[nodiscard]] virtual size_t digest_size() const = 0;

    [[nodiscard]] virtual std::unique_ptr<ScramClient> new_client(ScramCredentials credentials) const = 0;
};

/**
 * @brief Shared generator for a SCRAM mechanism.
 * @return The process-wide instance for SCRAM_SHA_256 / SCRAM_SHA_512,
 *         nullptr for any other mechanism
 */
[[nodiscard]] std::shared_ptr<const IScramMechanism> scram_mechanism_for(SaslMechanism mechanism);

} // namespace kafkasec
