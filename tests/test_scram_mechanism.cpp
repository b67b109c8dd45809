#include <catch2/catch_test_macros.hpp>
#include "sasl/scram_mechanism.hpp"

#include <openssl/evp.h>

#include <string>
#include <vector>

using namespace kafkasec;

namespace {

std::vector<uint8_t> b64decode(const std::string& in) {
    std::vector<uint8_t> out(3 * in.size() / 4 + 1);
    const int len = EVP_DecodeBlock(out.data(),
        reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
    REQUIRE(len >= 0);
    size_t padding = 0;
    if (!in.empty() && in.back() == '=') ++padding;
    if (in.size() > 1 && in[in.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

// RFC 7677 section 3 example exchange
constexpr const char* kClientFirstBare = "n=user,r=rOprNGfwEbeRWgbNEkqO";
constexpr const char* kServerFirst =
    "r=rOprNGfwEbeRWgbNEkqO%hvYDpWUa2RaTCAfuxFIlj)hNlF$k0,s=W22ZaJ0SNY7soEsUEjb6gQ==,i=4096";
constexpr const char* kClientFinalNoProof = "c=biws,r=rOprNGfwEbeRWgbNEkqO%hvYDpWUa2RaTCAfuxFIlj)hNlF$k0";

} // anonymous namespace

TEST_CASE("Scram: mechanism selection", "[scram]") {
    const auto sha256 = scram_mechanism_for(SaslMechanism::SCRAM_SHA_256);
    const auto sha512 = scram_mechanism_for(SaslMechanism::SCRAM_SHA_512);
    REQUIRE(sha256);
    REQUIRE(sha512);

    CHECK(sha256->name() == "SCRAM-SHA-256");
    CHECK(sha256->digest_size() == 32);
    CHECK(sha512->name() == "SCRAM-SHA-512");
    CHECK(sha512->digest_size() == 64);

    CHECK(scram_mechanism_for(SaslMechanism::PLAIN) == nullptr);
    CHECK(scram_mechanism_for(SaslMechanism::GSSAPI) == nullptr);
    CHECK(scram_mechanism_for(SaslMechanism::NONE) == nullptr);
}

TEST_CASE("Scram: mechanisms are shared instances", "[scram]") {
    CHECK(scram_mechanism_for(SaslMechanism::SCRAM_SHA_256)
          == scram_mechanism_for(SaslMechanism::SCRAM_SHA_256));
    CHECK(scram_mechanism_for(SaslMechanism::SCRAM_SHA_256)
          != scram_mechanism_for(SaslMechanism::SCRAM_SHA_512));
}

TEST_CASE("Scram: new_client binds credentials and hash", "[scram]") {
    const auto mech = scram_mechanism_for(SaslMechanism::SCRAM_SHA_512);
    const auto client = mech->new_client({"alice", "secret"});
    REQUIRE(client);
    CHECK(client->username() == "alice");
    CHECK(client->digest_size() == 64);
}

TEST_CASE("Scram: SHA-256 digest", "[scram]") {
    const auto client = scram_mechanism_for(SaslMechanism::SCRAM_SHA_256)->new_client({"u", "p"});

    // SHA-256("") = e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
    const auto hash = client->digest(std::vector<uint8_t>{});
    REQUIRE(hash.size() == 32);
    CHECK(hash[0] == 0xe3);
    CHECK(hash[1] == 0xb0);
    CHECK(hash[31] == 0x55);
}

TEST_CASE("Scram: SHA-512 digest", "[scram]") {
    const auto client = scram_mechanism_for(SaslMechanism::SCRAM_SHA_512)->new_client({"u", "p"});

    // SHA-512("") = cf83e135...f927da3e
    const auto hash = client->digest(std::string_view{});
    REQUIRE(hash.size() == 64);
    CHECK(hash[0] == 0xcf);
    CHECK(hash[1] == 0x83);
    CHECK(hash[63] == 0x3e);
}

TEST_CASE("Scram: HMAC-SHA-256", "[scram]") {
    const auto client = scram_mechanism_for(SaslMechanism::SCRAM_SHA_256)->new_client({"u", "p"});

    // Test vector from RFC 4231
    std::vector<uint8_t> key(20, 0x0b);
    const auto result = client->hmac(key, "Hi There");
    REQUIRE(result.size() == 32);
    // Expected: b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7
    CHECK(result[0] == 0xb0);
    CHECK(result[1] == 0x34);
    CHECK(result[31] == 0xf7);
}

TEST_CASE("Scram: XOR bytes", "[scram]") {
    std::vector<uint8_t> a = {0xFF, 0x00, 0xAA};
    std::vector<uint8_t> b = {0x0F, 0xF0, 0x55};
    CHECK(ScramClient::xor_bytes(a, b) == std::vector<uint8_t>{0xF0, 0xF0, 0xFF});
    CHECK_THROWS(ScramClient::xor_bytes(a, {0x01}));
}

TEST_CASE("Scram: SCRAM-SHA-256 exchange matches RFC 7677", "[scram]") {
    const auto client = scram_mechanism_for(SaslMechanism::SCRAM_SHA_256)->new_client({"user", "pencil"});

    const std::string auth_message = std::string(kClientFirstBare) + ","
        + kServerFirst + "," + kClientFinalNoProof;

    const auto salted = client->salted_password(b64decode("W22ZaJ0SNY7soEsUEjb6gQ=="), 4096);
    REQUIRE(salted.size() == 32);

    CHECK(client->client_proof(salted, auth_message)
          == b64decode("dHzbZapWIk4jUhN+Ute9ytag9zjfMHgsqmmiz7AndVQ="));

    const auto server_signature = b64decode("6rriTRBi23WpRR/wtup+mMhUZUn/dB5nLTJRsjl95G4=");
    CHECK(client->verify_server_signature(salted, auth_message, server_signature));

    auto tampered = server_signature;
    tampered[0] ^= 0x01;
    CHECK_FALSE(client->verify_server_signature(salted, auth_message, tampered));
}
