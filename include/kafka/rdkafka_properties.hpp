#pragma once

#include "core/error.hpp"
#include "profile/connection_profile.hpp"

#include <string>
#include <utility>
#include <vector>

typedef struct rd_kafka_conf_s rd_kafka_conf_t;

namespace kafkasec {

using RdKafkaProperties = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Map a profile onto librdkafka configuration properties.
 *
 * Key material goes in as PEM strings (ssl.ca.pem, ssl.certificate.pem,
 * ssl.key.pem), never as file paths, so the decrypted key stays in memory.
 * The Kerberos config path has no librdkafka property and is left to the
 * caller (KRB5_CONFIG). The SASL handshake flag has no counterpart either;
 * librdkafka always performs the handshake.
 */
[[nodiscard]] RdKafkaProperties to_rdkafka_properties(const ConnectionProfile& profile);

/**
 * @brief Set every property from to_rdkafka_properties() on `conf`.
 *
 * GSSAPI USER_AUTH is refused before anything is set: librdkafka obtains
 * Kerberos tickets through kinit and has no password property, so only
 * KEYTAB_AUTH profiles can be applied. to_rdkafka_properties() still lists
 * the principal for such a profile but never the password.
 *
 * @return CONFIG_ERROR for GSSAPI USER_AUTH, or naming the first property
 *         librdkafka rejects, with librdkafka's own error text
 */
[[nodiscard]] Result<bool> apply_to_conf(const ConnectionProfile& profile, rd_kafka_conf_t* conf);

} // namespace kafkasec
