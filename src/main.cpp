#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "kafka/rdkafka_properties.hpp"
#include "profile/connection_profile_builder.hpp"
#include "profile/profile_serializer.hpp"
#include "tls/ssl_context_factory.hpp"

#include <librdkafka/rdkafka.h>

#include <cstdlib>
#include <format>
#include <iostream>

using namespace kafkasec;

// Exit codes
static constexpr int kExitOk = 0;
static constexpr int kExitError = 1;
static constexpr int kExitUsage = 2;

static void print_usage(const char* prog) {
    std::cerr << std::format("Usage: {} <config.toml>\n", prog);
}

// Hand the profile to librdkafka so rejected properties surface here
// instead of at client start-up.
static bool check_rdkafka(const ConnectionProfile& profile) {
    rd_kafka_conf_t* conf = rd_kafka_conf_new();
    const auto applied = apply_to_conf(profile, conf);
    rd_kafka_conf_destroy(conf);

    if (applied.is_error()) {
        utils::log::error(applied.error_message());
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string config_file = argv[1];
    try {
        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitError;
        }
        const auto& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Building connection profile");
        const auto profile = ConnectionProfileBuilder::build(config.kafka);
        if (profile.is_error()) {
            utils::log::error(std::format("Profile build failed ({}): {}",
                error_category_name(profile.error_category()), profile.error_message()));
            return kExitError;
        }

        utils::log::info("[3/4] Checking TLS context and librdkafka properties");
        if (profile.value().tls.enabled) {
            const auto ctx = make_client_ssl_context(profile.value().tls);
            if (ctx.is_error()) {
                utils::log::error(std::format("TLS context check failed: {}", ctx.error_message()));
                return kExitError;
            }
        }
        if (!check_rdkafka(profile.value())) {
            return kExitError;
        }

        utils::log::info("[4/4] Profile OK");
        std::cout << profile_to_json(profile.value()).dump(2) << std::endl;
        return kExitOk;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitError;
    }
}
