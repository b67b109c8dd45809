#include <catch2/catch_test_macros.hpp>
#include "tls/ssl_context_factory.hpp"
#include "tls/tls_profile_builder.hpp"
#include "fixtures/cert_factory.hpp"

using namespace kafkasec;

TEST_CASE("SslContext: disabled profile is rejected", "[tls][ssl_ctx]") {
    TlsProfile profile;
    const auto result = make_client_ssl_context(profile);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
}

TEST_CASE("SslContext: system trust, verify peer", "[tls][ssl_ctx]") {
    TlsProfile profile;
    profile.enabled = true;

    const auto result = make_client_ssl_context(profile);
    REQUIRE(result.is_ok());
    SSL_CTX* ctx = result.value().get();
    CHECK(SSL_CTX_get_verify_mode(ctx) == SSL_VERIFY_PEER);
    CHECK(SSL_CTX_get_min_proto_version(ctx) == TLS1_2_VERSION);
}

TEST_CASE("SslContext: insecure_skip_verify disables verification", "[tls][ssl_ctx]") {
    TlsProfile profile;
    profile.enabled = true;
    profile.insecure_skip_verify = true;

    const auto result = make_client_ssl_context(profile);
    REQUIRE(result.is_ok());
    CHECK(SSL_CTX_get_verify_mode(result.value().get()) == SSL_VERIFY_NONE);
}

TEST_CASE("SslContext: decrypted client pair is usable for a handshake", "[tls][ssl_ctx]") {
    const auto& pki = test::TestPki::instance();
    test::TempFile ca("ca.pem", pki.other_cert_pem);
    test::TempFile cert("client.pem", pki.cert_pem);
    test::TempFile key("client_enc.key", pki.encrypted_key_pem);

    TlsSettings settings;
    settings.enabled = true;
    settings.ca_file = ca.path();
    settings.cert_file = cert.path();
    settings.key_file = key.path();
    settings.key_passphrase = test::TestPki::kPassphrase;

    const auto profile = build_tls(settings);
    REQUIRE(profile.is_ok());

    const auto result = make_client_ssl_context(profile.value());
    REQUIRE(result.is_ok());

    SSL_CTX* ctx = result.value().get();
    CHECK(SSL_CTX_get0_certificate(ctx) != nullptr);
    CHECK(SSL_CTX_get0_privatekey(ctx) != nullptr);
    CHECK(SSL_CTX_check_private_key(ctx) == 1);
}
