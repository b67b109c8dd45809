#pragma once

#include "tls/certificate_pair_loader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kafkasec {

struct TlsProfile {
    bool enabled = false;
    bool insecure_skip_verify = false;
    std::string ca_file;
    std::vector<std::string> trust_store;           // One PEM certificate per entry
    std::optional<CertificateKeyPair> client_pair;  // Set only for mutual TLS

    [[nodiscard]] bool uses_system_trust() const { return trust_store.empty(); }

    bool operator==(const TlsProfile&) const = default;
};

} // namespace kafkasec
