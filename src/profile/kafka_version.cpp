#include "profile/kafka_version.hpp"

#include <charconv>
#include <format>
#include <vector>

namespace kafkasec {

namespace {

// Split on '.', each component must be a non-empty run of digits
bool parse_components(std::string_view text, std::vector<unsigned>& out) {
    size_t pos = 0;
    while (pos <= text.size()) {
        const size_t dot = text.find('.', pos);
        const std::string_view part = text.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot - pos);
        if (part.empty()) return false;

        unsigned value = 0;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc{} || ptr != part.data() + part.size()) return false;
        out.push_back(value);

        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return true;
}

} // anonymous namespace

Result<KafkaVersion> KafkaVersion::parse(std::string_view text) {
    const auto invalid = [&] {
        return Result<KafkaVersion>::error(ErrorCategory::CONFIG_ERROR,
            std::format("invalid version '{}', expected X.Y.Z or 0.Y.Z.W", text));
    };

    if (text.size() < 5) return invalid();

    std::vector<unsigned> c;
    if (!parse_components(text, c)) return invalid();

    KafkaVersion version;
    if (text.front() == '0') {
        if (c.size() != 4 || c[0] != 0) return invalid();
        version = KafkaVersion(0, c[1], c[2], c[3]);
    } else {
        if (c.size() != 3) return invalid();
        version = KafkaVersion(c[0], c[1], c[2]);
    }
    return Result<KafkaVersion>::ok(version);
}

std::string KafkaVersion::to_string() const {
    if (parts_[0] == 0) {
        return std::format("0.{}.{}.{}", parts_[1], parts_[2], parts_[3]);
    }
    return std::format("{}.{}.{}", parts_[0], parts_[1], parts_[2]);
}

} // namespace kafkasec
