#pragma once

#include "sasl/sasl_mechanism.hpp"
#include "sasl/scram_mechanism.hpp"

#include <memory>
#include <optional>
#include <string>

namespace kafkasec {

struct GssapiParams {
    GssapiAuthType auth_type = GssapiAuthType::USER_AUTH;
    std::string username;
    std::string password;              // USER_AUTH only
    std::string keytab_path;           // KEYTAB_AUTH only
    std::string kerberos_config_path;
    std::string service_name;
    std::string realm;

    bool operator==(const GssapiParams&) const = default;
};

struct SaslProfile {
    bool enabled = false;
    std::string username;
    std::string password;
    bool handshake = true;
    SaslMechanism mechanism = SaslMechanism::NONE;

    // SCRAM_SHA_256 / SCRAM_SHA_512 only (shared, stateless)
    std::shared_ptr<const IScramMechanism> scram;

    // GSSAPI only
    std::optional<GssapiParams> gssapi;

    bool operator==(const SaslProfile&) const = default;
};

} // namespace kafkasec
