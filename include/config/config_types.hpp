#pragma once

#include <string>

namespace kafkasec {

// ============================================================================
// Configuration Types (caller-supplied input to ConnectionProfileBuilder)
// ============================================================================

struct TlsSettings {
    bool enabled = false;
    bool insecure_skip_verify = false;  // Disables broker certificate verification
    std::string ca_file;                // PEM bundle; empty = system trust store
    std::string cert_file;              // Client certificate (PEM)
    std::string key_file;               // Client private key (PEM, optionally legacy-encrypted)
    std::string key_passphrase;
};

struct GssapiSettings {
    std::string auth_type;              // "USER_AUTH:" or "KEYTAB_AUTH" (exact)
    std::string keytab_path;            // KEYTAB_AUTH only
    std::string kerberos_config_path;   // krb5.conf
    std::string service_name;
    std::string realm;
    std::string password;               // Used only when the SASL password is empty
};

struct SaslSettings {
    bool enabled = false;
    std::string username;
    std::string password;
    bool use_handshake = true;
    std::string mechanism;              // "", PLAIN, SCRAM-SHA-256, SCRAM-SHA-512, GSSAPI
    GssapiSettings gssapi;
};

struct ConnectionConfig {
    std::string client_id = "kafka-secure-connect";
    std::string version = "2.1.0";      // Kafka cluster protocol version
    TlsSettings tls;
    SaslSettings sasl;
};

struct LoggingConfig {
    std::string level = "info";
};

} // namespace kafkasec
