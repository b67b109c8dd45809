#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace kafkasec {

bool can_read_file(const std::string& path) {
    if (path.empty()) return false;

    // A directory opens fine with ifstream on Linux but is not readable material
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return false;

    std::ifstream file(path, std::ios::binary);
    return file.is_open();
}

Result<std::string> read_file(const std::string& path) {
    if (path.empty()) {
        return Result<std::string>::error(ErrorCategory::FILE_ACCESS_ERROR,
            "cannot read file: empty path");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::FILE_ACCESS_ERROR,
            std::format("cannot read {}: {}", path, std::strerror(errno)));
    }

    std::string contents((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::FILE_ACCESS_ERROR,
            std::format("cannot read {}: I/O error", path));
    }
    return Result<std::string>::ok(std::move(contents));
}

} // namespace kafkasec
