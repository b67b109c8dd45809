#include "tls/tls_profile_builder.hpp"
#include "crypto/openssl_types.hpp"
#include "crypto/pem.hpp"
#include "io/file_reader.hpp"
#include "core/utils.hpp"

#include <format>

namespace kafkasec {

Result<std::vector<std::string>> load_ca_bundle(const std::string& ca_path) {
    using R = Result<std::vector<std::string>>;

    auto bytes = read_file(ca_path);
    if (bytes.is_error()) return R::error_from(bytes);

    auto blocks = decode_all_pem(bytes.value());
    if (blocks.is_error()) {
        return R::error(ErrorCategory::PARSE_ERROR,
            std::format("malformed CA file {}: {}", ca_path, blocks.error_message()));
    }

    std::vector<std::string> certificates;
    for (const auto& block : blocks.value()) {
        if (block.type != "CERTIFICATE") continue;

        const auto* p = reinterpret_cast<const unsigned char*>(block.bytes.data());
        X509Ptr cert(d2i_X509(nullptr, &p, static_cast<long>(block.bytes.size())));
        if (!cert) {
            return R::error(ErrorCategory::PARSE_ERROR,
                std::format("malformed CA file {}: certificate #{} does not parse: {}",
                    ca_path, certificates.size() + 1, openssl_error_string()));
        }
        certificates.push_back(encode_pem(PemBlock{block.type, "", block.bytes}));
    }

    if (certificates.empty()) {
        return R::error(ErrorCategory::PARSE_ERROR,
            std::format("CA file {} contains no PEM certificates", ca_path));
    }
    return R::ok(std::move(certificates));
}

Result<TlsProfile> build_tls(const TlsSettings& settings) {
    TlsProfile profile;
    if (!settings.enabled) {
        return Result<TlsProfile>::ok(std::move(profile));
    }

    profile.enabled = true;
    profile.insecure_skip_verify = settings.insecure_skip_verify;
    if (profile.insecure_skip_verify) {
        utils::log::warn("TLS: insecure_skip_verify is set, broker certificates will NOT be verified");
    }

    if (!settings.ca_file.empty()) {
        auto cas = load_ca_bundle(settings.ca_file);
        if (cas.is_error()) return Result<TlsProfile>::error_from(cas);
        profile.ca_file = settings.ca_file;
        profile.trust_store = std::move(cas.value());
        utils::log::info(std::format("TLS: loaded {} CA certificate(s) from {}",
            profile.trust_store.size(), profile.ca_file));
    }

    if (!settings.cert_file.empty() || !settings.key_file.empty()) {
        auto pair = load_pair(settings.cert_file, settings.key_file, settings.key_passphrase);
        if (pair.is_error()) return Result<TlsProfile>::error_from(pair);
        profile.client_pair = std::move(pair.value());
    }

    return Result<TlsProfile>::ok(std::move(profile));
}

} // namespace kafkasec
