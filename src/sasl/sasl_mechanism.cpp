#include "sasl/sasl_mechanism.hpp"

#include <string>
#include <unordered_map>

namespace kafkasec {

std::optional<SaslMechanism> parse_sasl_mechanism(std::string_view name) {
    static const std::unordered_map<std::string_view, SaslMechanism> lookup = {
        {"",              SaslMechanism::PLAIN},
        {"PLAIN",         SaslMechanism::PLAIN},
        {"SCRAM-SHA-256", SaslMechanism::SCRAM_SHA_256},
        {"SCRAM-SHA-512", SaslMechanism::SCRAM_SHA_512},
        {"GSSAPI",        SaslMechanism::GSSAPI},
    };

    const auto it = lookup.find(name);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::string_view sasl_mechanism_name(SaslMechanism mechanism) {
    switch (mechanism) {
        case SaslMechanism::NONE:          return "";
        case SaslMechanism::PLAIN:         return "PLAIN";
        case SaslMechanism::SCRAM_SHA_256: return "SCRAM-SHA-256";
        case SaslMechanism::SCRAM_SHA_512: return "SCRAM-SHA-512";
        case SaslMechanism::GSSAPI:        return "GSSAPI";
    }
    return "";
}

std::optional<GssapiAuthType> parse_gssapi_auth_type(std::string_view value) {
    if (value == kGssapiUserAuth) return GssapiAuthType::USER_AUTH;
    if (value == kGssapiKeytabAuth) return GssapiAuthType::KEYTAB_AUTH;
    return std::nullopt;
}

std::string_view gssapi_auth_type_name(GssapiAuthType type) {
    switch (type) {
        case GssapiAuthType::USER_AUTH:   return kGssapiUserAuth;
        case GssapiAuthType::KEYTAB_AUTH: return kGssapiKeytabAuth;
    }
    return "";
}

} // namespace kafkasec
