#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <set>
#include <string>

#include "semroute/index/batch_writer.hpp"
#include "semroute/index/config_store.hpp"
#include "semroute/index/document.hpp"
#include "semroute/index/paginator.hpp"
#include "support/fake_typesense.hpp"

using namespace semroute;
using namespace semroute::index;
using semroute::testing::FakeTypesense;

namespace {

struct Fixture {
    std::shared_ptr<FakeTypesense> backend = std::make_shared<FakeTypesense>();
    typesense::Client client{backend, "routes"};
    SchemaManager schema{client};
    BatchWriter writer{client, schema};

    void populate(size_t n, std::string_view label = "route") {
        AddBatch batch;
        for (size_t i = 0; i < n; ++i) {
            batch.embeddings.push_back({1.0f, static_cast<float>(i)});
            batch.labels.emplace_back(label);
            batch.texts.push_back("utterance " + std::to_string(i));
        }
        REQUIRE(writer.add(batch).has_value());
    }
};

} // anonymous namespace

TEST_CASE("Full scan visits every record once", "[index][paginator]") {
    Fixture f;
    f.populate(600);
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 600);
    CHECK(std::set<std::string>(corpus->ids.begin(), corpus->ids.end()).size() == 600);
    // Three full or partial pages plus the terminating empty page.
    CHECK(paginator.pages_fetched() == 4);
    CHECK(f.backend->search_requests() == 4);

    auto last = f.backend->last_search();
    CHECK(last["per_page"] == kScanPageSize);
    CHECK(last["q"] == "*");
}

TEST_CASE("Exact page multiple still ends on an empty page", "[index][paginator]") {
    Fixture f;
    f.populate(10);
    FullScanPaginator paginator(f.client, 5);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 10);
    CHECK(paginator.pages_fetched() == 3);
}

TEST_CASE("Empty collection takes one fetch", "[index][paginator]") {
    Fixture f;
    REQUIRE(f.schema.ensure_collection(2).has_value());
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.empty());
    CHECK(paginator.pages_fetched() == 1);
}

TEST_CASE("Repeated pages stop the scan", "[index][paginator]") {
    Fixture f;
    f.populate(10);
    f.backend->repeat_first_page = true;
    FullScanPaginator paginator(f.client, 4);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 4);
    CHECK(paginator.pages_fetched() == 2);
}

TEST_CASE("Metadata objects carry label, text and schema", "[index][paginator]") {
    Fixture f;
    REQUIRE(f.writer.add(AddBatch{
        .embeddings = {{1, 0}, {0, 1}},
        .labels = {"weather", "chitchat"},
        .texts = {"is it raining", "hello"},
        .function_schemas = {json{{"name", "get_weather"}}},
        .metadata = {json{{"team", "ops"}}},
    }).has_value());
    FullScanPaginator paginator(f.client);

    SECTION("without free-form metadata") {
        auto corpus = paginator.enumerate_all();
        REQUIRE(corpus.has_value());
        REQUIRE(corpus->ids.size() == 2);
        for (const auto& meta : corpus->metadata) {
            CHECK(meta.contains("sr_route"));
            CHECK(meta.contains("sr_utterance"));
            CHECK(meta.contains("sr_function_schema"));
            CHECK_FALSE(meta.contains("team"));
        }
    }

    SECTION("with free-form metadata merged") {
        auto corpus = paginator.enumerate_all(std::nullopt, true);
        REQUIRE(corpus.has_value());
        auto weather_id = make_record_id("weather", "is it raining");
        for (size_t i = 0; i < corpus->ids.size(); ++i) {
            const auto& meta = corpus->metadata[i];
            if (corpus->ids[i] == weather_id) {
                CHECK(meta["team"] == "ops");
                CHECK(meta["sr_function_schema"] == R"({"name":"get_weather"})");
            } else {
                CHECK(meta["sr_function_schema"] == "null");
            }
        }
    }
}

TEST_CASE("Malformed metadata is dropped, not fatal", "[index][paginator]") {
    Fixture f;
    f.populate(3);
    auto& docs = f.backend->collections.at("routes").documents;
    docs.begin()->second["sr_metadata"] = "{broken";
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all(std::nullopt, true);
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 3);
    CHECK(corpus->metadata[0]["sr_route"] == "route");
}

TEST_CASE("Wrongly typed document fields do not abort the scan", "[index][paginator]") {
    Fixture f;
    f.populate(3);
    auto& docs = f.backend->collections.at("routes").documents;
    auto& odd = docs.begin()->second;
    const auto odd_id = docs.begin()->first;
    odd["sr_id"] = 12345;
    odd["sr_utterance"] = json::array({"not", "a", "string"});
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    REQUIRE(corpus->ids.size() == 3);
    auto pos = std::ranges::find(corpus->ids, odd_id);
    REQUIRE(pos != corpus->ids.end());
    const auto& meta = corpus->metadata[static_cast<size_t>(pos - corpus->ids.begin())];
    CHECK(meta["sr_route"] == "route");
    CHECK(meta["sr_utterance"] == "");
}

TEST_CASE("Configuration records are not enumerated", "[index][paginator]") {
    Fixture f;
    f.populate(2);
    ConfigStore store(f.client);
    REQUIRE(store.write({.field = "routes_hash", .value = "abc123"}, 2).has_value());
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 2);
    for (const auto& meta : corpus->metadata) {
        CHECK(meta["sr_route"] != "__config__");
    }
}

TEST_CASE("Prefix narrows enumeration to matching ids", "[index][paginator]") {
    Fixture f;
    f.populate(20);
    auto target = make_record_id("route", "utterance 7");
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all(target.substr(0, 6));
    REQUIRE(corpus.has_value());
    REQUIRE_FALSE(corpus->ids.empty());
    for (const auto& id : corpus->ids) {
        CHECK(id.starts_with(target.substr(0, 6)));
    }
    CHECK(std::ranges::find(corpus->ids, target) != corpus->ids.end());
}

TEST_CASE("Backend errors terminate the scan", "[index][paginator]") {
    Fixture f;
    f.populate(3);
    f.backend->offline = true;
    FullScanPaginator paginator(f.client);

    auto corpus = paginator.enumerate_all();
    REQUIRE_FALSE(corpus.has_value());
    CHECK(corpus.error().code() == ErrorCode::ConnectionFailed);
    CHECK(paginator.pages_fetched() == 1);
}
