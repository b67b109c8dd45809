#include <catch2/catch_test_macros.hpp>
#include "io/file_reader.hpp"
#include "fixtures/cert_factory.hpp"

#include <filesystem>

using namespace kafkasec;

TEST_CASE("FileReader: readable file", "[io]") {
    test::TempFile f("reader.txt", "hello\nworld\n");

    REQUIRE(can_read_file(f.path()));

    const auto result = read_file(f.path());
    REQUIRE(result.is_ok());
    CHECK(result.value() == "hello\nworld\n");
}

TEST_CASE("FileReader: binary content is returned unchanged", "[io]") {
    const std::string bytes("\x00\x01\xff\r\n\x7f", 6);
    test::TempFile f("reader.bin", bytes);

    const auto result = read_file(f.path());
    REQUIRE(result.is_ok());
    CHECK(result.value() == bytes);
}

TEST_CASE("FileReader: missing file", "[io]") {
    const std::string path = "/tmp/kafkasec_definitely_missing_file.pem";
    std::filesystem::remove(path);

    CHECK_FALSE(can_read_file(path));

    const auto result = read_file(path);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::FILE_ACCESS_ERROR);
    CHECK(result.error_message().find(path) != std::string::npos);
}

TEST_CASE("FileReader: empty path and directories are not readable", "[io]") {
    CHECK_FALSE(can_read_file(""));
    CHECK_FALSE(can_read_file(std::filesystem::temp_directory_path().string()));
    CHECK(read_file("").is_error());
}
