#include "profile/profile_serializer.hpp"

namespace kafkasec {

namespace {

nlohmann::json secret(const std::string& value) {
    // Empty secrets render as ""
    return value.empty() ? nlohmann::json("") : nlohmann::json(kRedacted);
}

nlohmann::json tls_to_json(const TlsProfile& tls) {
    nlohmann::json j;
    j["enabled"] = tls.enabled;
    if (!tls.enabled) return j;

    j["insecure_skip_verify"] = tls.insecure_skip_verify;
    j["ca_file"] = tls.ca_file;
    j["trust"] = tls.uses_system_trust() ? "system" : "bundle";
    j["trust_store_certificates"] = tls.trust_store.size();

    if (tls.client_pair) {
        const auto& pair = *tls.client_pair;
        j["client_certificate"] = {
            {"cert_file", pair.cert_file()},
            {"cert_bytes", pair.certificate_pem().size()},
            {"key_file", pair.key_file()},
            {"key", kRedacted},
            {"key_was_encrypted", pair.key_was_encrypted()},
        };
    } else {
        j["client_certificate"] = nullptr;
    }
    return j;
}

nlohmann::json sasl_to_json(const SaslProfile& sasl) {
    nlohmann::json j;
    j["enabled"] = sasl.enabled;
    if (!sasl.enabled) return j;

    j["mechanism"] = std::string(sasl_mechanism_name(sasl.mechanism));
    j["username"] = sasl.username;
    j["password"] = secret(sasl.password);
    j["handshake"] = sasl.handshake;

    if (sasl.scram) {
        j["scram"] = {
            {"mechanism", std::string(sasl.scram->name())},
            {"digest_size", sasl.scram->digest_size()},
        };
    }

    if (sasl.gssapi) {
        const auto& g = *sasl.gssapi;
        nlohmann::json gj = {
            {"auth_type", std::string(gssapi_auth_type_name(g.auth_type))},
            {"username", g.username},
            {"kerberos_config_path", g.kerberos_config_path},
            {"service_name", g.service_name},
            {"realm", g.realm},
        };
        if (g.auth_type == GssapiAuthType::USER_AUTH) {
            gj["password"] = secret(g.password);
        } else {
            gj["keytab_path"] = g.keytab_path;
        }
        j["gssapi"] = std::move(gj);
    }
    return j;
}

} // anonymous namespace

nlohmann::json profile_to_json(const ConnectionProfile& profile) {
    nlohmann::json j;
    j["client_id"] = profile.client_id;
    j["version"] = profile.version.to_string();
    j["timeouts_ms"] = {
        {"keep_alive", profile.timeouts.keep_alive.count()},
        {"dial", profile.timeouts.dial.count()},
        {"read", profile.timeouts.read.count()},
        {"write", profile.timeouts.write.count()},
    };
    j["tls"] = tls_to_json(profile.tls);
    j["sasl"] = sasl_to_json(profile.sasl);
    return j;
}

} // namespace kafkasec
