#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "semroute/core/config.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& n : names_) ::unsetenv(n.c_str());
    }
    ~EnvGuard() {
        for (const auto& n : names_) ::unsetenv(n.c_str());
    }
    std::vector<std::string> names_;
};

} // namespace

TEST_CASE("default_config returns backend defaults", "[config]") {
    auto cfg = semroute::default_config();

    CHECK(cfg.typesense.host == "localhost");
    CHECK(cfg.typesense.port == 8108);
    CHECK(cfg.typesense.protocol == "http");
    CHECK(cfg.typesense.api_key.empty());
    CHECK(cfg.typesense.collection == "semantic_routes");
    CHECK(cfg.typesense.connection_timeout_seconds == 10);
    CHECK(cfg.typesense.base_url() == "http://localhost:8108");

    CHECK(cfg.encoder.api_version == "2024-02-01");
    CHECK(cfg.encoder.deployment == "text-embedding-ada-002");
    CHECK_FALSE(cfg.encoder.use_managed_identity);
    CHECK(cfg.log_level == "info");
    CHECK(cfg.top_k == 5);
}

TEST_CASE("load_config parses JSON file", "[config]") {
    namespace fs = std::filesystem;

    auto tmp = fs::temp_directory_path() / "semroute_test_config.json";
    {
        std::ofstream out(tmp);
        out << R"({
            "typesense": {"host": "search.internal", "port": 443, "protocol": "https",
                          "collection": "routes_v2"},
            "encoder": {"endpoint": "https://example.openai.azure.com"},
            "top_k": 3
        })";
    }

    auto cfg = semroute::load_config(tmp);
    CHECK(cfg.typesense.host == "search.internal");
    CHECK(cfg.typesense.port == 443);
    CHECK(cfg.typesense.collection == "routes_v2");
    CHECK(cfg.typesense.base_url() == "https://search.internal:443");
    CHECK(cfg.encoder.endpoint == "https://example.openai.azure.com");
    CHECK(cfg.encoder.deployment == "text-embedding-ada-002");
    CHECK(cfg.top_k == 3);

    fs::remove(tmp);
}

TEST_CASE("load_config falls back to defaults", "[config]") {
    namespace fs = std::filesystem;

    SECTION("missing file") {
        auto cfg = semroute::load_config("/nonexistent/semroute.json");
        CHECK(cfg.typesense.host == "localhost");
    }

    SECTION("invalid JSON") {
        auto tmp = fs::temp_directory_path() / "semroute_bad_config.json";
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = semroute::load_config(tmp);
        CHECK(cfg.typesense.collection == "semantic_routes");
        fs::remove(tmp);
    }
}

TEST_CASE("environment overrides configuration", "[config]") {
    EnvGuard guard({"TYPESENSE_HOST", "TYPESENSE_PORT", "TYPESENSE_API_KEY",
                    "TYPESENSE_COLLECTION", "AZURE_USE_MANAGED_IDENTITY",
                    "AZURE_OPENAI_API_KEY"});

    ::setenv("TYPESENSE_HOST", "ts.example", 1);
    ::setenv("TYPESENSE_API_KEY", "xyz", 1);
    ::setenv("TYPESENSE_COLLECTION", "intents", 1);
    ::setenv("AZURE_USE_MANAGED_IDENTITY", "TRUE", 1);
    ::setenv("AZURE_OPENAI_API_KEY", "k-123", 1);

    SECTION("valid values") {
        ::setenv("TYPESENSE_PORT", "9108", 1);
        auto cfg = semroute::load_config_from_env();
        CHECK(cfg.typesense.host == "ts.example");
        CHECK(cfg.typesense.port == 9108);
        CHECK(cfg.typesense.api_key == "xyz");
        CHECK(cfg.typesense.collection == "intents");
        CHECK(cfg.encoder.use_managed_identity);
        REQUIRE(cfg.encoder.api_key.has_value());
        CHECK(*cfg.encoder.api_key == "k-123");
    }

    SECTION("unparseable port is ignored") {
        ::setenv("TYPESENSE_PORT", "not-a-port", 1);
        auto cfg = semroute::load_config_from_env();
        CHECK(cfg.typesense.port == 8108);
    }

    SECTION("out-of-range port is ignored") {
        ::setenv("TYPESENSE_PORT", "99999", 1);
        CHECK(semroute::load_config_from_env().typesense.port == 8108);

        ::setenv("TYPESENSE_PORT", "0", 1);
        CHECK(semroute::load_config_from_env().typesense.port == 8108);
    }
}

TEST_CASE("redact hides credentials", "[config]") {
    semroute::Config cfg;
    cfg.typesense.api_key = "secret-key";
    cfg.encoder.api_key = "azure-key";

    auto j = semroute::redact(cfg);
    CHECK(j["typesense"]["api_key"] == "***REDACTED***");
    CHECK(j["encoder"]["api_key"] == "***REDACTED***");
    CHECK(j["encoder"]["ad_token"].is_null());
    CHECK(j["typesense"]["host"] == "localhost");
}
