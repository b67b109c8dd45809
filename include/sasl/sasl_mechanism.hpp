#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kafkasec {

enum class SaslMechanism {
    NONE,
    PLAIN,
    SCRAM_SHA_256,
    SCRAM_SHA_512,
    GSSAPI
};

enum class GssapiAuthType {
    USER_AUTH,
    KEYTAB_AUTH
};

// Auth type literals as they appear in configuration. The trailing colon on
// USER_AUTH is part of the accepted value.
inline constexpr std::string_view kGssapiUserAuth = "USER_AUTH:";
inline constexpr std::string_view kGssapiKeytabAuth = "KEYTAB_AUTH";

/**
 * @brief Parse a configured mechanism name.
 *
 * "" and "PLAIN" map to PLAIN; "SCRAM-SHA-256", "SCRAM-SHA-512" and "GSSAPI"
 * map to their values. Matching is exact (case-sensitive).
 * @return std::nullopt for anything else
 */
[[nodiscard]] std::optional<SaslMechanism> parse_sasl_mechanism(std::string_view name);

/// Wire name of the mechanism ("PLAIN", "SCRAM-SHA-256", ...; "" for NONE)
[[nodiscard]] std::string_view sasl_mechanism_name(SaslMechanism mechanism);

/// Exact match against kGssapiUserAuth / kGssapiKeytabAuth
[[nodiscard]] std::optional<GssapiAuthType> parse_gssapi_auth_type(std::string_view value);

[[nodiscard]] std::string_view gssapi_auth_type_name(GssapiAuthType type);

} // namespace kafkasec
