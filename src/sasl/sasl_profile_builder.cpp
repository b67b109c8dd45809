#include "sasl/sasl_profile_builder.hpp"
#include "core/utils.hpp"

#include <format>

namespace kafkasec {

namespace {

Result<GssapiParams> build_gssapi(const SaslSettings& settings) {
    const auto& g = settings.gssapi;

    const auto auth_type = parse_gssapi_auth_type(g.auth_type);
    if (!auth_type) {
        return Result<GssapiParams>::error(ErrorCategory::CONFIG_ERROR,
            std::format("unknown GSSAPI auth type '{}', expected '{}' or '{}'",
                g.auth_type, kGssapiUserAuth, kGssapiKeytabAuth));
    }

    GssapiParams params;
    params.auth_type = *auth_type;
    params.username = settings.username;
    params.kerberos_config_path = g.kerberos_config_path;
    params.service_name = g.service_name;
    params.realm = g.realm;

    switch (params.auth_type) {
        case GssapiAuthType::USER_AUTH:
            params.password = settings.password.empty() ? g.password : settings.password;
            break;
        case GssapiAuthType::KEYTAB_AUTH:
            params.keytab_path = g.keytab_path;
            break;
    }
    return Result<GssapiParams>::ok(std::move(params));
}

} // anonymous namespace

Result<SaslProfile> build_sasl(const SaslSettings& settings) {
    SaslProfile profile;
    if (!settings.enabled) {
        return Result<SaslProfile>::ok(std::move(profile));
    }

    profile.enabled = true;
    profile.username = settings.username;
    profile.password = settings.password;
    profile.handshake = settings.use_handshake;

    const auto mechanism = parse_sasl_mechanism(settings.mechanism);
    if (!mechanism) {
        return Result<SaslProfile>::error(ErrorCategory::CONFIG_ERROR,
            std::format("unknown SASL mechanism '{}', expected PLAIN, SCRAM-SHA-256, SCRAM-SHA-512 or GSSAPI",
                settings.mechanism));
    }
    profile.mechanism = *mechanism;

    switch (profile.mechanism) {
        case SaslMechanism::SCRAM_SHA_256:
        case SaslMechanism::SCRAM_SHA_512:
            profile.scram = scram_mechanism_for(profile.mechanism);
            break;
        case SaslMechanism::GSSAPI: {
            auto gssapi = build_gssapi(settings);
            if (gssapi.is_error()) return Result<SaslProfile>::error_from(gssapi);
            profile.gssapi = std::move(gssapi.value());
            break;
        }
        case SaslMechanism::PLAIN:
        case SaslMechanism::NONE:
            break;
    }

    utils::log::debug(std::format("SASL: mechanism={} user={} handshake={}",
        sasl_mechanism_name(profile.mechanism), profile.username, utils::booltostr(profile.handshake)));

    return Result<SaslProfile>::ok(std::move(profile));
}

} // namespace kafkasec
