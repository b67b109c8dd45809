#include "crypto/private_key_decryptor.hpp"
#include "crypto/openssl_types.hpp"
#include "core/utils.hpp"

#include <openssl/pem.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <vector>

namespace kafkasec {

namespace {

constexpr std::string_view kDecryptFailure = "private key is encrypted, but could not decrypt it";

int passphrase_callback(char* buf, int size, int /*rwflag*/, void* userdata) {
    const auto* passphrase = static_cast<const std::string*>(userdata);
    if (!passphrase || passphrase->empty()) return -1;

    const size_t len = std::min(passphrase->size(), static_cast<size_t>(size));
    std::memcpy(buf, passphrase->data(), len);
    return static_cast<int>(len);
}

Result<std::string> decrypt_failure(const std::string& cause) {
    return Result<std::string>::error(ErrorCategory::DECRYPTION_ERROR,
        std::format("{}: '{}'", kDecryptFailure, cause));
}

} // anonymous namespace

bool is_encrypted(const PemBlock& block) {
    return block.headers.find("DEK-Info:") != std::string::npos
        || block.headers.find("4,ENCRYPTED") != std::string::npos;
}

Result<std::string> decrypt_private_key(std::string_view key_bytes, const std::string& passphrase) {
    auto block = decode_pem(key_bytes);
    if (!block) {
        return Result<std::string>::error(ErrorCategory::PARSE_ERROR,
            "no valid private key found");
    }

    if (!is_encrypted(*block)) {
        return Result<std::string>::ok(std::string(key_bytes));
    }

    utils::log::warn(std::format(
        "private key block '{}' uses legacy PEM encryption; consider an unencrypted key held in a secrets store",
        block->type));

    if (passphrase.empty()) {
        return decrypt_failure("no passphrase supplied");
    }

    // PEM_get_EVP_CIPHER_INFO scribbles on the header buffer while parsing
    std::vector<char> header(block->headers.begin(), block->headers.end());
    header.push_back('\0');

    ERR_clear_error();
    EVP_CIPHER_INFO cipher_info;
    if (PEM_get_EVP_CIPHER_INFO(header.data(), &cipher_info) != 1) {
        return decrypt_failure(openssl_error_string("unsupported PEM encryption header"));
    }

    std::vector<unsigned char> data(block->bytes.begin(), block->bytes.end());
    long len = static_cast<long>(data.size());
    if (PEM_do_header(&cipher_info, data.data(), &len, passphrase_callback,
                      const_cast<std::string*>(&passphrase)) != 1) {
        return decrypt_failure(openssl_error_string("decryption failed"));
    }

    // CBC padding alone lets roughly 1 in 256 wrong passphrases through
    const unsigned char* p = data.data();
    EvpPkeyPtr parsed(d2i_AutoPrivateKey(nullptr, &p, len));
    if (!parsed) {
        ERR_clear_error();
        return decrypt_failure("incorrect passphrase");
    }

    PemBlock plain;
    plain.type = block->type;
    plain.bytes.assign(reinterpret_cast<const char*>(data.data()), static_cast<size_t>(len));
    OPENSSL_cleanse(data.data(), data.size());

    return Result<std::string>::ok(encode_pem(plain));
}

} // namespace kafkasec
