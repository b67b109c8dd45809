#include "kafka/rdkafka_properties.hpp"
#include "core/utils.hpp"

#include <librdkafka/rdkafka.h>

#include <algorithm>
#include <format>

namespace kafkasec {

namespace {

std::string_view security_protocol(const ConnectionProfile& profile) {
    if (profile.tls.enabled) {
        return profile.sasl.enabled ? "sasl_ssl" : "ssl";
    }
    return profile.sasl.enabled ? "sasl_plaintext" : "plaintext";
}

void add_tls(const TlsProfile& tls, RdKafkaProperties& props) {
    if (!tls.trust_store.empty()) {
        std::string bundle;
        for (const auto& cert : tls.trust_store) {
            bundle += cert;
        }
        props.emplace_back("ssl.ca.pem", std::move(bundle));
    }
    if (tls.client_pair) {
        props.emplace_back("ssl.certificate.pem", tls.client_pair->certificate_pem());
        props.emplace_back("ssl.key.pem", tls.client_pair->private_key_pem());
    }
    props.emplace_back("enable.ssl.certificate.verification",
        utils::booltostr(!tls.insecure_skip_verify));
    props.emplace_back("ssl.endpoint.identification.algorithm",
        tls.insecure_skip_verify ? "none" : "https");
}

void add_sasl(const SaslProfile& sasl, RdKafkaProperties& props) {
    props.emplace_back("sasl.mechanisms", std::string(sasl_mechanism_name(sasl.mechanism)));

    if (sasl.mechanism != SaslMechanism::GSSAPI) {
        props.emplace_back("sasl.username", sasl.username);
        props.emplace_back("sasl.password", sasl.password);
        return;
    }
    if (!sasl.gssapi) return;

    const auto& g = *sasl.gssapi;
    props.emplace_back("sasl.kerberos.service.name", g.service_name);
    props.emplace_back("sasl.kerberos.principal", std::format("{}@{}", g.username, g.realm));
    if (g.auth_type == GssapiAuthType::KEYTAB_AUTH) {
        props.emplace_back("sasl.kerberos.keytab", g.keytab_path);
    }
}

} // anonymous namespace

RdKafkaProperties to_rdkafka_properties(const ConnectionProfile& profile) {
    RdKafkaProperties props;

    props.emplace_back("client.id", profile.client_id);
    props.emplace_back("broker.version.fallback", profile.version.to_string());
    // ApiVersionRequest exists from 0.10.0 on
    props.emplace_back("api.version.request",
        utils::booltostr(profile.version.is_at_least(KafkaVersion(0, 10, 0, 0))));

    const auto& t = profile.timeouts;
    props.emplace_back("socket.keepalive.enable", utils::booltostr(t.keep_alive.count() > 0));
    props.emplace_back("socket.connection.setup.timeout.ms", std::to_string(t.dial.count()));
    props.emplace_back("socket.timeout.ms", std::to_string(std::max(t.read, t.write).count()));

    props.emplace_back("security.protocol", std::string(security_protocol(profile)));

    if (profile.tls.enabled) {
        add_tls(profile.tls, props);
    }
    if (profile.sasl.enabled) {
        add_sasl(profile.sasl, props);
    }
    return props;
}

Result<bool> apply_to_conf(const ConnectionProfile& profile, rd_kafka_conf_t* conf) {
    if (!conf) {
        return Result<bool>::error(ErrorCategory::INTERNAL_ERROR, "librdkafka conf is null");
    }

    // librdkafka logs in through kinit and has no property for a password
    const auto& sasl = profile.sasl;
    if (sasl.enabled && sasl.mechanism == SaslMechanism::GSSAPI
        && sasl.gssapi && sasl.gssapi->auth_type == GssapiAuthType::USER_AUTH) {
        return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
            "GSSAPI user/password auth cannot be expressed as librdkafka properties, use KEYTAB_AUTH");
    }

    char errstr[512];
    for (const auto& [key, value] : to_rdkafka_properties(profile)) {
        if (rd_kafka_conf_set(conf, key.c_str(), value.c_str(),
                              errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            return Result<bool>::error(ErrorCategory::CONFIG_ERROR,
                std::format("librdkafka rejected '{}': {}", key, errstr));
        }
    }

    utils::log::debug(std::format("Applied connection profile to librdkafka conf (client_id={})",
        profile.client_id));
    return Result<bool>::ok(true);
}

} // namespace kafkasec
