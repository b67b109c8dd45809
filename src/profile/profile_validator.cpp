#include "profile/profile_validator.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace kafkasec {

namespace {

bool is_valid_client_id(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

void validate_gssapi(const SaslProfile& sasl, std::vector<std::string>& errors) {
    if (!sasl.gssapi) {
        errors.emplace_back("sasl.gssapi parameters are required for the GSSAPI mechanism");
        return;
    }
    const auto& g = *sasl.gssapi;
    if (g.service_name.empty()) {
        errors.emplace_back("sasl.gssapi.service_name must not be empty when GSSAPI is used");
    }
    if (g.kerberos_config_path.empty()) {
        errors.emplace_back("sasl.gssapi.kerberos_config_path must not be empty when GSSAPI is used");
    }
    if (g.username.empty()) {
        errors.emplace_back("sasl.username must not be empty when GSSAPI is used");
    }
    if (g.realm.empty()) {
        errors.emplace_back("sasl.gssapi.realm must not be empty when GSSAPI is used");
    }
    switch (g.auth_type) {
        case GssapiAuthType::USER_AUTH:
            if (g.password.empty()) {
                errors.emplace_back("sasl.password must not be empty when GSSAPI user auth is used");
            }
            break;
        case GssapiAuthType::KEYTAB_AUTH:
            if (g.keytab_path.empty()) {
                errors.emplace_back("sasl.gssapi.keytab_path must not be empty when GSSAPI keytab auth is used");
            }
            break;
    }
}

void validate_sasl(const SaslProfile& sasl, std::vector<std::string>& errors) {
    if (!sasl.enabled) {
        if (sasl.mechanism != SaslMechanism::NONE || sasl.scram || sasl.gssapi) {
            errors.emplace_back("sasl mechanism is set while SASL is disabled");
        }
        return;
    }

    const bool is_scram = sasl.mechanism == SaslMechanism::SCRAM_SHA_256
                       || sasl.mechanism == SaslMechanism::SCRAM_SHA_512;

    switch (sasl.mechanism) {
        case SaslMechanism::NONE:
            errors.emplace_back("sasl.mechanism must be set when SASL is enabled");
            return;
        case SaslMechanism::PLAIN:
        case SaslMechanism::SCRAM_SHA_256:
        case SaslMechanism::SCRAM_SHA_512:
            if (sasl.username.empty()) {
                errors.emplace_back("sasl.username must not be empty when SASL is enabled");
            }
            if (sasl.password.empty()) {
                errors.emplace_back("sasl.password must not be empty when SASL is enabled");
            }
            break;
        case SaslMechanism::GSSAPI:
            validate_gssapi(sasl, errors);
            break;
    }

    if (is_scram && (!sasl.scram || sasl.scram->name() != sasl_mechanism_name(sasl.mechanism))) {
        errors.push_back(std::format("sasl SCRAM generator does not match mechanism {}",
            sasl_mechanism_name(sasl.mechanism)));
    }
    if (!is_scram && sasl.scram) {
        errors.emplace_back("sasl SCRAM generator is set for a non-SCRAM mechanism");
    }
    if (sasl.mechanism != SaslMechanism::GSSAPI && sasl.gssapi) {
        errors.emplace_back("sasl.gssapi parameters are set for a non-GSSAPI mechanism");
    }
}

} // anonymous namespace

std::vector<std::string> validate_profile(const ConnectionProfile& profile) {
    std::vector<std::string> errors;

    if (!is_valid_client_id(profile.client_id)) {
        errors.push_back(std::format("client_id '{}' is invalid, allowed characters are [A-Za-z0-9._-]",
            profile.client_id));
    }

    const auto& t = profile.timeouts;
    if (t.keep_alive.count() <= 0 || t.dial.count() <= 0 || t.read.count() <= 0 || t.write.count() <= 0) {
        errors.emplace_back("network timeouts must be > 0");
    }

    if (!profile.tls.enabled && (profile.tls.client_pair || !profile.tls.trust_store.empty())) {
        errors.emplace_back("TLS material is present while TLS is disabled");
    }
    if (profile.tls.client_pair
        && (profile.tls.client_pair->certificate_pem().empty()
            || profile.tls.client_pair->private_key_pem().empty())) {
        errors.emplace_back("TLS client certificate pair is incomplete");
    }

    validate_sasl(profile.sasl, errors);
    return errors;
}

} // namespace kafkasec
