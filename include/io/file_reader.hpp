#pragma once

#include "core/error.hpp"

#include <string>

namespace kafkasec {

/**
 * @brief Returns true if the file at the given path exists and can be opened
 * for reading. Absence or missing permission is reported as false, never as
 * an error. The handle is closed before returning.
 */
[[nodiscard]] bool can_read_file(const std::string& path);

/**
 * @brief Read the whole file into memory.
 * @return File contents, or FILE_ACCESS_ERROR naming the path.
 */
[[nodiscard]] Result<std::string> read_file(const std::string& path);

} // namespace kafkasec
