#pragma once

#include "core/error.hpp"

#include <array>
#include <compare>
#include <string>
#include <string_view>

namespace kafkasec {

/**
 * @brief Kafka cluster protocol version.
 *
 * Accepted forms are "X.Y.Z" with X >= 1 (e.g. "2.8.0") and the pre-1.0
 * four-part form "0.Y.Z.W" (e.g. "0.10.2.1").
 */
class KafkaVersion {
public:
    KafkaVersion() = default;
    KafkaVersion(unsigned major, unsigned minor, unsigned patch, unsigned build = 0)
        : parts_{major, minor, patch, build} {}

    /**
     * @brief Parse a version string.
     * Only the form is checked, so releases newer than this library parse.
     * @return CONFIG_ERROR if the form is wrong
     */
    [[nodiscard]] static Result<KafkaVersion> parse(std::string_view text);

    [[nodiscard]] bool is_at_least(const KafkaVersion& other) const { return *this >= other; }

    /// Canonical rendering ("2.8.0", "0.10.2.1")
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const KafkaVersion&) const = default;

private:
    std::array<unsigned, 4> parts_{0, 0, 0, 0};
};

} // namespace kafkasec
