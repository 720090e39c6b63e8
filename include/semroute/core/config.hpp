#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json: lets the NLOHMANN_DEFINE macros
// handle optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace semroute {

using json = nlohmann::json;

/// Connection settings for the search backend.
struct TypesenseConfig {
    std::string host = "localhost";
    uint16_t port = 8108;
    std::string protocol = "http";
    std::string api_key;
    std::string collection = "semantic_routes";
    int connection_timeout_seconds = 10;

    [[nodiscard]] auto base_url() const -> std::string {
        return protocol + "://" + host + ":" + std::to_string(port);
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TypesenseConfig, host, port, protocol, api_key, collection, connection_timeout_seconds)

/// Azure OpenAI embedding deployment. Exactly one auth strategy is picked,
/// in order: managed identity, static Entra ID token, API key.
struct EncoderConfig {
    std::string endpoint;
    std::string api_version = "2024-02-01";
    std::string deployment = "text-embedding-ada-002";
    bool use_managed_identity = false;
    std::optional<std::string> ad_token;
    std::optional<std::string> api_key;
    int timeout_seconds = 60;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(EncoderConfig, endpoint, api_version, deployment, use_managed_identity, ad_token, api_key, timeout_seconds)

struct Config {
    TypesenseConfig typesense;
    EncoderConfig encoder;
    std::optional<std::string> routes_file;
    std::string log_level = "info";
    size_t top_k = 5;
    double score_threshold = 0.0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, typesense, encoder, routes_file, log_level, top_k, score_threshold)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays TYPESENSE_*, AZURE_* and SEMROUTE_* environment variables.
void apply_env_overrides(Config& config);

/// JSON view of the configuration with credentials redacted.
auto redact(const Config& config) -> json;

} // namespace semroute
