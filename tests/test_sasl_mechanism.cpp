#include <catch2/catch_test_macros.hpp>
#include "sasl/sasl_mechanism.hpp"

using namespace kafkasec;

TEST_CASE("SaslMechanism: known names", "[sasl]") {
    CHECK(parse_sasl_mechanism("PLAIN") == SaslMechanism::PLAIN);
    CHECK(parse_sasl_mechanism("SCRAM-SHA-256") == SaslMechanism::SCRAM_SHA_256);
    CHECK(parse_sasl_mechanism("SCRAM-SHA-512") == SaslMechanism::SCRAM_SHA_512);
    CHECK(parse_sasl_mechanism("GSSAPI") == SaslMechanism::GSSAPI);
}

TEST_CASE("SaslMechanism: empty name defaults to PLAIN", "[sasl]") {
    CHECK(parse_sasl_mechanism("") == SaslMechanism::PLAIN);
}

TEST_CASE("SaslMechanism: matching is exact", "[sasl]") {
    CHECK_FALSE(parse_sasl_mechanism("plain").has_value());
    CHECK_FALSE(parse_sasl_mechanism("scram-sha-256").has_value());
    CHECK_FALSE(parse_sasl_mechanism(" PLAIN").has_value());
    CHECK_FALSE(parse_sasl_mechanism("OAUTHBEARER").has_value());
}

TEST_CASE("SaslMechanism: names round-trip", "[sasl]") {
    for (const auto m : {SaslMechanism::PLAIN, SaslMechanism::SCRAM_SHA_256,
                         SaslMechanism::SCRAM_SHA_512, SaslMechanism::GSSAPI}) {
        CHECK(parse_sasl_mechanism(sasl_mechanism_name(m)) == m);
    }
    CHECK(sasl_mechanism_name(SaslMechanism::NONE).empty());
}

TEST_CASE("GssapiAuthType: literal values", "[sasl][gssapi]") {
    CHECK(parse_gssapi_auth_type("USER_AUTH:") == GssapiAuthType::USER_AUTH);
    CHECK(parse_gssapi_auth_type("KEYTAB_AUTH") == GssapiAuthType::KEYTAB_AUTH);

    // The trailing colon is part of the user-auth literal
    CHECK_FALSE(parse_gssapi_auth_type("USER_AUTH").has_value());
    CHECK_FALSE(parse_gssapi_auth_type("KEYTAB_AUTH:").has_value());
    CHECK_FALSE(parse_gssapi_auth_type("keytab_auth").has_value());
    CHECK_FALSE(parse_gssapi_auth_type("").has_value());

    CHECK(gssapi_auth_type_name(GssapiAuthType::USER_AUTH) == "USER_AUTH:");
    CHECK(gssapi_auth_type_name(GssapiAuthType::KEYTAB_AUTH) == "KEYTAB_AUTH");
}
