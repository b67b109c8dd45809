#include "tls/certificate_pair_loader.hpp"
#include "crypto/openssl_types.hpp"
#include "crypto/pem.hpp"
#include "crypto/private_key_decryptor.hpp"
#include "io/file_reader.hpp"
#include "core/utils.hpp"

#include <openssl/pem.h>

#include <format>
#include <vector>

namespace kafkasec {

namespace {

constexpr std::string_view kPairError = "could not load X509 key pair";

// Never prompt on the terminal for PKCS#8-encrypted keys
int no_password_callback(char* /*buf*/, int /*size*/, int /*rwflag*/, void* /*userdata*/) {
    return -1;
}

Result<CertificateKeyPair> pair_error(const std::string& detail) {
    return Result<CertificateKeyPair>::error(ErrorCategory::PAIR_MISMATCH_ERROR,
        std::format("{}: {}", kPairError, detail));
}

} // anonymous namespace

Result<bool> check_pair_readable(const std::string& cert_path, const std::string& key_path) {
    const bool cert_readable = can_read_file(cert_path);
    const bool key_readable = can_read_file(key_path);

    std::string err;
    if (!cert_readable && !key_readable) {
        err = "cannot read key and certificate";
    } else if (!cert_readable) {
        err = cert_path.empty()
            ? "certificate file path is empty, certificate and key must be supplied as a pair"
            : std::format("cannot read certificate file '{}', certificate and key must be supplied as a pair",
                  cert_path);
    } else if (!key_readable) {
        err = key_path.empty()
            ? "key file path is empty, certificate and key must be supplied as a pair"
            : std::format("cannot read key file '{}', certificate and key must be supplied as a pair",
                  key_path);
    }

    if (!err.empty()) {
        return Result<bool>::error(ErrorCategory::FILE_ACCESS_ERROR, std::move(err));
    }
    return Result<bool>::ok(true);
}

Result<CertificateKeyPair> load_pair(const std::string& cert_path,
                                     const std::string& key_path,
                                     const std::string& passphrase) {
    auto readable = check_pair_readable(cert_path, key_path);
    if (readable.is_error()) return Result<CertificateKeyPair>::error_from(readable);

    // Files can disappear between the check and the read
    auto cert_bytes = read_file(cert_path);
    if (cert_bytes.is_error()) return Result<CertificateKeyPair>::error_from(cert_bytes);

    auto key_bytes = read_file(key_path);
    if (key_bytes.is_error()) return Result<CertificateKeyPair>::error_from(key_bytes);

    auto key_pem = decrypt_private_key(key_bytes.value(), passphrase);
    if (key_pem.is_error()) return Result<CertificateKeyPair>::error_from(key_pem);

    // Leaf first, intermediates after, as in any PEM chain file
    auto blocks = decode_all_pem(cert_bytes.value());
    if (blocks.is_error()) {
        return pair_error(std::format("{}: {}", cert_path, blocks.error_message()));
    }

    std::vector<X509Ptr> chain;
    for (const auto& block : blocks.value()) {
        if (block.type != "CERTIFICATE") continue;
        const auto* p = reinterpret_cast<const unsigned char*>(block.bytes.data());
        X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(block.bytes.size())));
        if (!cert) {
            return pair_error(std::format("{}: failed to parse certificate: {}",
                cert_path, openssl_error_string()));
        }
        chain.push_back(std::move(cert));
    }
    if (chain.empty()) {
        return pair_error(std::format("failed to find any PEM data in certificate input {}", cert_path));
    }

    const auto key_bio = make_mem_bio(key_pem.value());
    ERR_clear_error();
    EvpPkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, no_password_callback, nullptr));
    if (!key) {
        return pair_error(std::format("{}: failed to parse private key: {}",
            key_path, openssl_error_string()));
    }

    if (X509_check_private_key(chain.front().get(), key.get()) != 1) {
        ERR_clear_error();
        return pair_error(std::format("private key {} does not match certificate {}", key_path, cert_path));
    }

    const bool was_encrypted = key_pem.value() != key_bytes.value();
    utils::log::debug(std::format("Loaded client certificate (cert={}, key={}, chain={}, decrypted={})",
        cert_path, key_path, chain.size(), utils::booltostr(was_encrypted)));

    return Result<CertificateKeyPair>::ok(CertificateKeyPair(
        cert_path, key_path, std::move(cert_bytes.value()), std::move(key_pem.value()), was_encrypted));
}

} // namespace kafkasec
