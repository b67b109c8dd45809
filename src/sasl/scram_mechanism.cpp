#include "sasl/scram_mechanism.hpp"

#include <openssl/crypto.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace kafkasec {

// ============================================================================
// ScramClient
// ============================================================================

ScramClient::ScramClient(const EVP_MD* md, ScramCredentials credentials)
    : md_(md), credentials_(std::move(credentials)) {
    if (!md_) {
        throw std::invalid_argument("ScramClient: null digest");
    }
}

size_t ScramClient::digest_size() const {
    return static_cast<size_t>(EVP_MD_get_size(md_));
}

std::vector<uint8_t> ScramClient::digest(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), result.data(), &len, md_, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    result.resize(len);
    return result;
}

std::vector<uint8_t> ScramClient::digest(std::string_view data) const {
    return digest(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> ScramClient::hmac(const std::vector<uint8_t>& key,
                                       std::string_view message) const {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (!HMAC(md_,
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const uint8_t*>(message.data()),
              message.size(),
              result.data(), &len)) {
        throw std::runtime_error("HMAC failed");
    }
    result.resize(len);
    return result;
}

std::vector<uint8_t> ScramClient::salted_password(const std::vector<uint8_t>& salt,
                                                  uint32_t iterations) const {
    std::vector<uint8_t> result(digest_size());
    if (PKCS5_PBKDF2_HMAC(
            credentials_.password.data(), static_cast<int>(credentials_.password.size()),
            salt.data(), static_cast<int>(salt.size()),
            static_cast<int>(iterations),
            md_,
            static_cast<int>(result.size()), result.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return result;
}

std::vector<uint8_t> ScramClient::client_key(const std::vector<uint8_t>& salted_pw) const {
    return hmac(salted_pw, "Client Key");
}

std::vector<uint8_t> ScramClient::server_key(const std::vector<uint8_t>& salted_pw) const {
    return hmac(salted_pw, "Server Key");
}

std::vector<uint8_t> ScramClient::stored_key(const std::vector<uint8_t>& client_key_val) const {
    return digest(client_key_val);
}

std::vector<uint8_t> ScramClient::client_proof(const std::vector<uint8_t>& salted_pw,
                                               std::string_view auth_message) const {
    const auto ck = client_key(salted_pw);
    const auto client_signature = hmac(stored_key(ck), auth_message);
    return xor_bytes(ck, client_signature);
}

bool ScramClient::verify_server_signature(const std::vector<uint8_t>& salted_pw,
                                          std::string_view auth_message,
                                          const std::vector<uint8_t>& signature) const {
    const auto expected = hmac(server_key(salted_pw), auth_message);
    return expected.size() == signature.size()
        && CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

std::vector<uint8_t> ScramClient::xor_bytes(const std::vector<uint8_t>& a,
                                            const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        throw std::runtime_error("XOR: mismatched lengths");
    }
    std::vector<uint8_t> result(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        result[i] = a[i] ^ b[i];
    }
    return result;
}

// ============================================================================
// Mechanisms
// ============================================================================

namespace {

class ScramShaMechanism final : public IScramMechanism {
public:
    ScramShaMechanism(std::string_view name, const EVP_MD* md)
        : name_(name), md_(md) {}

    std::string_view name() const override { return name_; }

    size_t digest_size() const override {
        return static_cast<size_t>(EVP_MD_get_size(md_));
    }

    std::unique_ptr<ScramClient> new_client(ScramCredentials credentials) const override {
        return std::make_unique<ScramClient>(md_, std::move(credentials));
    }

private:
    std::string_view name_;
    const EVP_MD* md_;
};

} // anonymous namespace

std::shared_ptr<const IScramMechanism> scram_mechanism_for(SaslMechanism mechanism) {
    static const auto sha256 = std::make_shared<const ScramShaMechanism>(
        sasl_mechanism_name(SaslMechanism::SCRAM_SHA_256), EVP_sha256());
    static const auto sha512 = std::make_shared<const ScramShaMechanism>(
        sasl_mechanism_name(SaslMechanism::SCRAM_SHA_512), EVP_sha512());

    switch (mechanism) {
        case SaslMechanism::SCRAM_SHA_256: return sha256;
        case SaslMechanism::SCRAM_SHA_512: return sha512;
        default:                           return nullptr;
    }
}

} // namespace kafkasec
