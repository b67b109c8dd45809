#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace kafkasec {

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    LoggingConfig logging;
    ConnectionConfig kafka;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Reads the [logging] and [kafka] sections of a TOML file.
 *
 * `${VAR}` references inside strings are expanded from the environment before
 * extraction. Syntax errors, wrong value types and unknown log levels are
 * load errors. Whether the connection settings make sense together is left
 * to ConnectionProfileBuilder.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Expand ${VAR_NAME} references from the environment.
     * Unset variables expand to "".
     * @throws std::runtime_error on an unclosed "${"
     */
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ConnectionConfig extract_kafka(const toml::table& root);
    static TlsSettings extract_tls(const toml::table& kafka);
    static SaslSettings extract_sasl(const toml::table& kafka);
    static GssapiSettings extract_gssapi(const toml::table& sasl);

    static std::vector<std::string> validate_config(const AppConfig& config);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace kafkasec
