#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kafkasec {

/**
 * @brief One decoded PEM block.
 *
 * `headers` holds the RFC 1421 header lines verbatim (e.g.
 * "Proc-Type: 4,ENCRYPTED\nDEK-Info: AES-128-CBC,...\n"), empty for
 * modern PEM. `bytes` is the base64-decoded body (DER).
 */
struct PemBlock {
    std::string type;       // Label after "-----BEGIN ", e.g. "RSA PRIVATE KEY"
    std::string headers;
    std::string bytes;
};

/**
 * @brief Decode the first PEM block found in `data`.
 *
 * Text before the first BEGIN line is skipped.
 * @return The block, or std::nullopt if no valid block is present.
 */
[[nodiscard]] std::optional<PemBlock> decode_pem(std::string_view data);

/**
 * @brief Decode every PEM block in `data`, in order.
 * @return Blocks (possibly empty), or PARSE_ERROR if a block is truncated or
 *         its body is not valid base64.
 */
[[nodiscard]] Result<std::vector<PemBlock>> decode_all_pem(std::string_view data);

/**
 * @brief Encode a block back to PEM text (64-column base64, headers kept).
 * @throws std::runtime_error if OpenSSL cannot allocate the output buffer
 */
[[nodiscard]] std::string encode_pem(const PemBlock& block);

} // namespace kafkasec
