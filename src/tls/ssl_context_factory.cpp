#include "tls/ssl_context_factory.hpp"

#include <openssl/pem.h>

#include <format>

namespace kafkasec {

namespace {

int no_password_callback(char* /*buf*/, int /*size*/, int /*rwflag*/, void* /*userdata*/) {
    return -1;
}

} // anonymous namespace

Result<SslCtxPtr> make_client_ssl_context(const TlsProfile& profile) {
    using R = Result<SslCtxPtr>;

    if (!profile.enabled) {
        return R::error(ErrorCategory::CONFIG_ERROR, "TLS is disabled in this profile");
    }

    ERR_clear_error();
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("failed to create SSL_CTX: {}", openssl_error_string()));
    }

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);

    // Trust store
    if (profile.uses_system_trust()) {
        if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
            return R::error(ErrorCategory::INTERNAL_ERROR,
                std::format("failed to load system trust store: {}", openssl_error_string()));
        }
    } else {
        X509_STORE* store = SSL_CTX_get_cert_store(ctx.get());
        for (const auto& pem : profile.trust_store) {
            const auto bio = make_mem_bio(pem);
            X509Ptr ca(PEM_read_bio_X509(bio.get(), nullptr, no_password_callback, nullptr));
            if (!ca || X509_STORE_add_cert(store, ca.get()) != 1) {
                return R::error(ErrorCategory::PARSE_ERROR,
                    std::format("failed to add CA certificate from {}: {}",
                        profile.ca_file, openssl_error_string()));
            }
        }
    }

    // Client certificate (mutual TLS)
    if (profile.client_pair) {
        const auto& pair = *profile.client_pair;

        const auto cert_bio = make_mem_bio(pair.certificate_pem());
        X509Ptr leaf(PEM_read_bio_X509(cert_bio.get(), nullptr, no_password_callback, nullptr));
        if (!leaf || SSL_CTX_use_certificate(ctx.get(), leaf.get()) != 1) {
            return R::error(ErrorCategory::PAIR_MISMATCH_ERROR,
                std::format("failed to use certificate {}: {}", pair.cert_file(), openssl_error_string()));
        }

        // Remaining certificates in the file form the chain
        while (true) {
            X509Ptr extra(PEM_read_bio_X509(cert_bio.get(), nullptr, no_password_callback, nullptr));
            if (!extra) {
                ERR_clear_error();
                break;
            }
            // add0 takes ownership on success
            if (SSL_CTX_add0_chain_cert(ctx.get(), extra.get()) != 1) {
                return R::error(ErrorCategory::PAIR_MISMATCH_ERROR,
                    std::format("failed to add chain certificate from {}: {}",
                        pair.cert_file(), openssl_error_string()));
            }
            (void)extra.release();
        }

        const auto key_bio = make_mem_bio(pair.private_key_pem());
        EvpPkeyPtr key(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, no_password_callback, nullptr));
        if (!key || SSL_CTX_use_PrivateKey(ctx.get(), key.get()) != 1) {
            return R::error(ErrorCategory::PAIR_MISMATCH_ERROR,
                std::format("failed to use private key {}: {}", pair.key_file(), openssl_error_string()));
        }

        if (SSL_CTX_check_private_key(ctx.get()) != 1) {
            return R::error(ErrorCategory::PAIR_MISMATCH_ERROR,
                std::format("private key {} does not match certificate {}", pair.key_file(), pair.cert_file()));
        }
    }

    SSL_CTX_set_verify(ctx.get(),
        profile.insecure_skip_verify ? SSL_VERIFY_NONE : SSL_VERIFY_PEER, nullptr);

    return R::ok(std::move(ctx));
}

} // namespace kafkasec
