#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace kafkasec {

// ============================================================================
// TOML Parsing Helpers (env expansion, typed access)
// ============================================================================

namespace {

// Rewrites every string under `node`, at any depth of tables and arrays
void expand_in_place(toml::node& node) {
    if (auto* str = node.as_string()) {
        *str = ConfigLoader::expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, child] : *tbl) expand_in_place(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_in_place(child);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_in_place(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_in_place(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------
// A missing key keeps the default; a key of the wrong type is an error.

const toml::table* toml_section(const toml::table& parent, std::string_view key,
                                std::string_view path) {
    const auto node = parent[key];
    if (!node) return nullptr;
    if (const auto* tbl = node.as_table()) return tbl;
    throw std::runtime_error(std::format("{} must be a table", path));
}

std::string toml_string(const toml::table& tbl, std::string_view section,
                        std::string_view key, std::string fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* s = node.as_string()) return s->get();
    throw std::runtime_error(std::format("{}.{} must be a string", section, key));
}

bool toml_bool(const toml::table& tbl, std::string_view section,
               std::string_view key, bool fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* b = node.as_boolean()) return b->get();
    throw std::runtime_error(std::format("{}.{} must be a boolean", section, key));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::string ConfigLoader::expand_env_vars(const std::string& input) {
    std::string out;
    size_t pos = 0;
    for (size_t open; (open = input.find("${", pos)) != std::string::npos; ) {
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input, pos, open - pos);
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    out.append(input, pos, std::string::npos);
    return out;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = toml_section(root, "logging", "logging");
    if (!logging) return cfg;

    cfg.level = toml_string(*logging, "logging", "level", cfg.level);
    return cfg;
}

GssapiSettings ConfigLoader::extract_gssapi(const toml::table& sasl) {
    GssapiSettings cfg;
    const auto* g = toml_section(sasl, "gssapi", "kafka.sasl.gssapi");
    if (!g) return cfg;

    constexpr std::string_view sec = "kafka.sasl.gssapi";
    cfg.auth_type = toml_string(*g, sec, "auth_type", ""s);
    cfg.keytab_path = toml_string(*g, sec, "keytab_path", ""s);
    cfg.kerberos_config_path = toml_string(*g, sec, "kerberos_config_path", ""s);
    cfg.service_name = toml_string(*g, sec, "service_name", ""s);
    cfg.realm = toml_string(*g, sec, "realm", ""s);
    cfg.password = toml_string(*g, sec, "password", ""s);
    return cfg;
}

SaslSettings ConfigLoader::extract_sasl(const toml::table& kafka) {
    SaslSettings cfg;
    const auto* s = toml_section(kafka, "sasl", "kafka.sasl");
    if (!s) return cfg;

    constexpr std::string_view sec = "kafka.sasl";
    cfg.enabled = toml_bool(*s, sec, "enabled", false);
    cfg.mechanism = toml_string(*s, sec, "mechanism", ""s);
    cfg.username = toml_string(*s, sec, "username", ""s);
    cfg.password = toml_string(*s, sec, "password", ""s);
    cfg.use_handshake = toml_bool(*s, sec, "use_handshake", true);
    cfg.gssapi = extract_gssapi(*s);
    return cfg;
}

TlsSettings ConfigLoader::extract_tls(const toml::table& kafka) {
    TlsSettings cfg;
    const auto* t = toml_section(kafka, "tls", "kafka.tls");
    if (!t) return cfg;

    constexpr std::string_view sec = "kafka.tls";
    cfg.enabled = toml_bool(*t, sec, "enabled", false);
    cfg.insecure_skip_verify = toml_bool(*t, sec, "insecure_skip_verify", false);
    cfg.ca_file = toml_string(*t, sec, "ca_file", ""s);
    cfg.cert_file = toml_string(*t, sec, "cert_file", ""s);
    cfg.key_file = toml_string(*t, sec, "key_file", ""s);
    cfg.key_passphrase = toml_string(*t, sec, "key_passphrase", ""s);
    return cfg;
}

ConnectionConfig ConfigLoader::extract_kafka(const toml::table& root) {
    ConnectionConfig cfg;
    const auto* kafka = toml_section(root, "kafka", "kafka");
    if (!kafka) return cfg;
    const auto& k = *kafka;

    cfg.client_id = toml_string(k, "kafka", "client_id", cfg.client_id);
    cfg.version = toml_string(k, "kafka", "version", cfg.version);
    cfg.tls = extract_tls(k);
    cfg.sasl = extract_sasl(k);
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.kafka = extract_kafka(root);
    return config;
}

// ---- Validation ------------------------------------------------------------

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            config.logging.level));
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace kafkasec
