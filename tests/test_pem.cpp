#include <catch2/catch_test_macros.hpp>
#include "crypto/pem.hpp"
#include "fixtures/cert_factory.hpp"

using namespace kafkasec;

TEST_CASE("PEM: decode first block", "[pem]") {
    const auto& pki = test::TestPki::instance();

    const auto block = decode_pem(pki.cert_pem);
    REQUIRE(block.has_value());
    CHECK(block->type == "CERTIFICATE");
    CHECK(block->headers.empty());
    CHECK_FALSE(block->bytes.empty());
}

TEST_CASE("PEM: no block in input", "[pem]") {
    CHECK_FALSE(decode_pem("").has_value());
    CHECK_FALSE(decode_pem("just some text, no armour").has_value());
}

TEST_CASE("PEM: legacy encryption headers are kept", "[pem]") {
    const auto& pki = test::TestPki::instance();

    const auto block = decode_pem(pki.encrypted_key_pem);
    REQUIRE(block.has_value());
    CHECK(block->type == "RSA PRIVATE KEY");
    CHECK(block->headers.find("Proc-Type: 4,ENCRYPTED") != std::string::npos);
    CHECK(block->headers.find("DEK-Info:") != std::string::npos);
}

TEST_CASE("PEM: decode all blocks of a bundle", "[pem]") {
    const auto& pki = test::TestPki::instance();
    const std::string bundle = pki.cert_pem + pki.other_cert_pem + pki.key_pem;

    const auto blocks = decode_all_pem(bundle);
    REQUIRE(blocks.is_ok());
    REQUIRE(blocks.value().size() == 3);
    CHECK(blocks.value()[0].type == "CERTIFICATE");
    CHECK(blocks.value()[1].type == "CERTIFICATE");
    CHECK(blocks.value()[2].type == "PRIVATE KEY");
}

TEST_CASE("PEM: empty bundle yields no blocks", "[pem]") {
    const auto blocks = decode_all_pem("");
    REQUIRE(blocks.is_ok());
    CHECK(blocks.value().empty());
}

TEST_CASE("PEM: truncated block is malformed", "[pem]") {
    const auto& pki = test::TestPki::instance();
    const std::string truncated = pki.cert_pem.substr(0, pki.cert_pem.size() / 2);

    const auto blocks = decode_all_pem(truncated);
    REQUIRE(blocks.is_error());
    CHECK(blocks.error_category() == ErrorCategory::PARSE_ERROR);
}

TEST_CASE("PEM: encode reproduces the input armour", "[pem]") {
    const auto& pki = test::TestPki::instance();

    const auto block = decode_pem(pki.cert_pem);
    REQUIRE(block.has_value());
    CHECK(encode_pem(*block) == pki.cert_pem);
}
