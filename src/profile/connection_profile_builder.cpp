#include "profile/connection_profile_builder.hpp"
#include "core/utils.hpp"
#include "profile/profile_validator.hpp"
#include "sasl/sasl_profile_builder.hpp"
#include "tls/tls_profile_builder.hpp"

#include <format>

namespace kafkasec {

Result<ConnectionProfile> ConnectionProfileBuilder::build(const ConnectionConfig& config) {
    // Version first: an unknown version must fail before any file is read
    auto version = KafkaVersion::parse(config.version);
    if (version.is_error()) {
        return Result<ConnectionProfile>::error_from(version);
    }

    ConnectionProfile profile;
    profile.client_id = config.client_id;
    profile.version = version.value();
    profile.timeouts = NetworkTimeouts{};

    auto tls = build_tls(config.tls);
    if (tls.is_error()) {
        return Result<ConnectionProfile>::error_from(tls);
    }
    profile.tls = std::move(tls.value());

    auto sasl = build_sasl(config.sasl);
    if (sasl.is_error()) {
        return Result<ConnectionProfile>::error_from(sasl);
    }
    profile.sasl = std::move(sasl.value());

    const auto problems = validate_profile(profile);
    if (!problems.empty()) {
        std::string msg = "profile validation failed:";
        for (const auto& p : problems) {
            msg += "\n  - " + p;
        }
        return Result<ConnectionProfile>::error(ErrorCategory::VALIDATION_ERROR, std::move(msg));
    }

    utils::log::info(std::format("Connection profile built: client_id={} version={} tls={} sasl={}",
        profile.client_id, profile.version.to_string(),
        utils::booltostr(profile.tls.enabled),
        profile.sasl.enabled ? std::string(sasl_mechanism_name(profile.sasl.mechanism)) : "off"));

    return Result<ConnectionProfile>::ok(std::move(profile));
}

} // namespace kafkasec
