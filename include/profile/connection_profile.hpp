#pragma once

#include "profile/kafka_version.hpp"
#include "sasl/sasl_profile.hpp"
#include "tls/tls_profile.hpp"

#include <chrono>
#include <string>

namespace kafkasec {

/**
 * @brief Network timeouts handed to the Kafka client library.
 * Fixed by policy; not configurable.
 */
struct NetworkTimeouts {
    static constexpr std::chrono::seconds kDefault{15};

    std::chrono::milliseconds keep_alive{kDefault};
    std::chrono::milliseconds dial{kDefault};
    std::chrono::milliseconds read{kDefault};
    std::chrono::milliseconds write{kDefault};

    bool operator==(const NetworkTimeouts&) const = default;
};

/**
 * @brief Fully assembled and validated connection settings.
 *
 * Produced only by ConnectionProfileBuilder::build(). A disabled `tls` or
 * `sasl` member means that layer is not used.
 */
struct ConnectionProfile {
    std::string client_id;
    KafkaVersion version;
    NetworkTimeouts timeouts;
    TlsProfile tls;
    SaslProfile sasl;

    bool operator==(const ConnectionProfile&) const = default;
};

} // namespace kafkasec
