#include <catch2/catch_test_macros.hpp>
#include "sasl/sasl_profile_builder.hpp"

using namespace kafkasec;

namespace {

SaslSettings enabled_sasl(const std::string& mechanism) {
    SaslSettings s;
    s.enabled = true;
    s.mechanism = mechanism;
    s.username = "svc";
    s.password = "pw";
    return s;
}

} // anonymous namespace

TEST_CASE("SaslBuilder: disabled settings", "[sasl][builder]") {
    SaslSettings settings;
    settings.username = "ignored";
    settings.mechanism = "GSSAPI";

    const auto result = build_sasl(settings);
    REQUIRE(result.is_ok());
    CHECK_FALSE(result.value().enabled);
    CHECK(result.value().mechanism == SaslMechanism::NONE);
    CHECK(result.value().username.empty());
    CHECK_FALSE(result.value().scram);
    CHECK_FALSE(result.value().gssapi.has_value());
}

TEST_CASE("SaslBuilder: PLAIN copies credentials verbatim", "[sasl][builder]") {
    auto settings = enabled_sasl("PLAIN");
    settings.use_handshake = false;

    const auto result = build_sasl(settings);
    REQUIRE(result.is_ok());
    const auto& p = result.value();
    CHECK(p.enabled);
    CHECK(p.mechanism == SaslMechanism::PLAIN);
    CHECK(p.username == "svc");
    CHECK(p.password == "pw");
    CHECK_FALSE(p.handshake);
    CHECK_FALSE(p.scram);
    CHECK_FALSE(p.gssapi.has_value());
}

TEST_CASE("SaslBuilder: empty mechanism means PLAIN", "[sasl][builder]") {
    const auto result = build_sasl(enabled_sasl(""));
    REQUIRE(result.is_ok());
    CHECK(result.value().mechanism == SaslMechanism::PLAIN);
}

TEST_CASE("SaslBuilder: SCRAM-SHA-256 attaches a 32-byte generator", "[sasl][builder][scram]") {
    const auto result = build_sasl(enabled_sasl("SCRAM-SHA-256"));
    REQUIRE(result.is_ok());
    const auto& p = result.value();
    CHECK(p.mechanism == SaslMechanism::SCRAM_SHA_256);
    REQUIRE(p.scram);
    CHECK(p.scram->name() == "SCRAM-SHA-256");
    CHECK(p.scram->digest_size() == 32);

    const auto client = p.scram->new_client({p.username, p.password});
    CHECK(client->digest_size() == 32);
}

TEST_CASE("SaslBuilder: SCRAM-SHA-512 attaches a 64-byte generator", "[sasl][builder][scram]") {
    const auto result = build_sasl(enabled_sasl("SCRAM-SHA-512"));
    REQUIRE(result.is_ok());
    REQUIRE(result.value().scram);
    CHECK(result.value().scram->digest_size() == 64);
}

TEST_CASE("SaslBuilder: unknown mechanism", "[sasl][builder]") {
    const auto result = build_sasl(enabled_sasl("OAUTHBEARER"));
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(result.error_message().find("OAUTHBEARER") != std::string::npos);
}

TEST_CASE("SaslBuilder: GSSAPI keytab auth", "[sasl][builder][gssapi]") {
    auto settings = enabled_sasl("GSSAPI");
    settings.password = "";
    settings.gssapi.auth_type = "KEYTAB_AUTH";
    settings.gssapi.keytab_path = "/etc/krb5.keytab";
    settings.gssapi.kerberos_config_path = "/etc/krb5.conf";
    settings.gssapi.service_name = "kafka";
    settings.gssapi.realm = "EXAMPLE.COM";

    const auto result = build_sasl(settings);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().gssapi.has_value());

    const auto& g = *result.value().gssapi;
    CHECK(g.auth_type == GssapiAuthType::KEYTAB_AUTH);
    CHECK(g.keytab_path == "/etc/krb5.keytab");
    CHECK(g.username == "svc");
    CHECK(g.kerberos_config_path == "/etc/krb5.conf");
    CHECK(g.service_name == "kafka");
    CHECK(g.realm == "EXAMPLE.COM");
    CHECK(g.password.empty());
    CHECK_FALSE(result.value().scram);
}

TEST_CASE("SaslBuilder: GSSAPI user auth takes the SASL password", "[sasl][builder][gssapi]") {
    auto settings = enabled_sasl("GSSAPI");
    settings.gssapi.auth_type = "USER_AUTH:";
    settings.gssapi.password = "gssapi-pw";
    settings.gssapi.keytab_path = "/etc/krb5.keytab";

    const auto result = build_sasl(settings);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().gssapi.has_value());

    const auto& g = *result.value().gssapi;
    CHECK(g.auth_type == GssapiAuthType::USER_AUTH);
    CHECK(g.password == "pw");
    CHECK(g.keytab_path.empty());
}

TEST_CASE("SaslBuilder: GSSAPI user auth falls back to the GSSAPI password", "[sasl][builder][gssapi]") {
    auto settings = enabled_sasl("GSSAPI");
    settings.password = "";
    settings.gssapi.auth_type = "USER_AUTH:";
    settings.gssapi.password = "gssapi-pw";

    const auto result = build_sasl(settings);
    REQUIRE(result.is_ok());
    CHECK(result.value().gssapi->password == "gssapi-pw");
}

TEST_CASE("SaslBuilder: GSSAPI auth type without the colon is rejected", "[sasl][builder][gssapi]") {
    auto settings = enabled_sasl("GSSAPI");
    settings.gssapi.auth_type = "USER_AUTH";

    const auto result = build_sasl(settings);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
}

TEST_CASE("SaslBuilder: same settings build equal profiles", "[sasl][builder]") {
    const auto settings = enabled_sasl("SCRAM-SHA-512");
    const auto a = build_sasl(settings);
    const auto b = build_sasl(settings);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value() == b.value());
}
