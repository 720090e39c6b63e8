#include "semroute/core/config.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace semroute {

namespace {

/// Recursively redacts credential values in a JSON object.
void redact_json(json& j) {
    static const std::vector<std::string> sensitive_keys = {
        "api_key", "ad_token", "token",
    };

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_sensitive = std::ranges::find(sensitive_keys, it.key()) !=
                                sensitive_keys.end();
            if (is_sensitive && it->is_string() && !it->get<std::string>().empty()) {
                *it = "***REDACTED***";
            } else {
                redact_json(*it);
            }
        }
    } else if (j.is_array()) {
        for (auto& elem : j) {
            redact_json(elem);
        }
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("TYPESENSE_HOST")) {
        config.typesense.host = val;
    }
    if (auto* val = std::getenv("TYPESENSE_PORT")) {
        try {
            auto port = std::stoi(val);
            if (port < 1 || port > 65535) {
                LOG_WARN("Ignoring out-of-range TYPESENSE_PORT '{}'", val);
            } else {
                config.typesense.port = static_cast<uint16_t>(port);
            }
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid TYPESENSE_PORT '{}'", val);
        }
    }
    if (auto* val = std::getenv("TYPESENSE_PROTOCOL")) {
        config.typesense.protocol = val;
    }
    if (auto* val = std::getenv("TYPESENSE_API_KEY")) {
        config.typesense.api_key = val;
    }
    if (auto* val = std::getenv("TYPESENSE_COLLECTION")) {
        config.typesense.collection = val;
    }

    if (auto* val = std::getenv("AZURE_OPENAI_ENDPOINT")) {
        config.encoder.endpoint = val;
    }
    if (auto* val = std::getenv("AZURE_OPENAI_API_VERSION")) {
        config.encoder.api_version = val;
    }
    if (auto* val = std::getenv("AZURE_EMBEDDING_DEPLOYMENT")) {
        config.encoder.deployment = val;
    }
    if (auto* val = std::getenv("AZURE_USE_MANAGED_IDENTITY")) {
        config.encoder.use_managed_identity = utils::to_lower(val) == "true";
    }
    if (auto* val = std::getenv("AZURE_AD_TOKEN")) {
        config.encoder.ad_token = val;
    }
    if (auto* val = std::getenv("AZURE_OPENAI_API_KEY")) {
        config.encoder.api_key = val;
    }

    if (auto* val = std::getenv("SEMROUTE_ROUTES_FILE")) {
        config.routes_file = val;
    }
    if (auto* val = std::getenv("SEMROUTE_LOG_LEVEL")) {
        config.log_level = val;
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto redact(const Config& config) -> json {
    json j = config;
    redact_json(j);
    return j;
}

} // namespace semroute
