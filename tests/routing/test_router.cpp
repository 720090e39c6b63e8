#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

#include "semroute/index/document.hpp"
#include "semroute/index/typesense_index.hpp"
#include "semroute/routing/router.hpp"
#include "support/fake_typesense.hpp"

using namespace semroute;
using namespace semroute::routing;
using semroute::testing::FakeTypesense;

namespace {

// Maps keywords onto axes so nearest-neighbour results are predictable.
class KeywordEncoder : public encoders::EmbeddingProvider {
public:
    auto embed(std::string_view text) -> Result<std::vector<float>> override {
        ++single_calls;
        if (text.find("refund") != std::string_view::npos ||
            text.find("invoice") != std::string_view::npos) {
            return std::vector<float>{1.0f, 0.1f, 0.0f};
        }
        if (text.find("weather") != std::string_view::npos) {
            return std::vector<float>{0.1f, 1.0f, 0.0f};
        }
        return std::vector<float>{0.0f, 0.0f, 1.0f};
    }

    auto embed_batch(const std::vector<std::string>& texts)
        -> Result<std::vector<std::vector<float>>> override {
        ++batch_calls;
        embedded += texts.size();
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) {
            out.push_back(*embed(t));
            --single_calls;
        }
        return out;
    }

    [[nodiscard]] auto dimensions() const -> size_t override { return 3; }

    int single_calls = 0;
    int batch_calls = 0;
    size_t embedded = 0;
};

auto small_catalog() -> std::vector<Route> {
    return {
        Route{.name = "billing", .utterances = {"I need a refund", "where is my invoice"}},
        Route{.name = "chitchat", .utterances = {"lovely weather today"}},
    };
}

struct Fixture {
    std::shared_ptr<FakeTypesense> backend = std::make_shared<FakeTypesense>();
    std::shared_ptr<KeywordEncoder> encoder = std::make_shared<KeywordEncoder>();
    std::shared_ptr<index::TypesenseIndex> idx =
        std::make_shared<index::TypesenseIndex>(backend, "routes");

    auto router(std::vector<Route> routes, RouterOptions options = {}) -> SemanticRouter {
        return SemanticRouter(encoder, idx, std::move(routes), options);
    }
};

} // anonymous namespace

TEST_CASE("First sync indexes every utterance and stores the hash", "[routing][router]") {
    Fixture f;
    auto router = f.router(small_catalog());

    auto report = router.sync();
    REQUIRE(report.has_value());
    CHECK_FALSE(report->skipped);
    CHECK(report->added == 3);
    CHECK(report->removed == 0);
    CHECK(f.encoder->batch_calls == 1);

    auto stored = f.idx->read_config(SemanticRouter::kHashField);
    REQUIRE(stored.has_value());
    CHECK(stored->value == routes_hash(small_catalog()));
}

TEST_CASE("Sync with a matching hash is skipped", "[routing][router]") {
    Fixture f;
    REQUIRE(f.router(small_catalog()).sync().has_value());

    auto report = f.router(small_catalog()).sync();
    REQUIRE(report.has_value());
    CHECK(report->skipped);
    CHECK(f.encoder->batch_calls == 1);
}

TEST_CASE("Sync reconciles changed routes", "[routing][router]") {
    Fixture f;
    REQUIRE(f.router(small_catalog()).sync().has_value());

    auto updated = small_catalog();
    updated[0].utterances = {"I need a refund", "refund my order"};
    updated.pop_back();

    auto report = f.router(updated).sync();
    REQUIRE(report.has_value());
    CHECK(report->added == 1);
    CHECK(report->removed == 2);
    CHECK(report->unchanged == 1);
    CHECK(f.encoder->embedded == 4);

    auto corpus = f.idx->enumerate_all();
    REQUIRE(corpus.has_value());
    CHECK(corpus->ids.size() == 2);
    for (const auto& meta : corpus->metadata) {
        CHECK(meta["sr_route"] == "billing");
    }
    CHECK(f.idx->read_config(SemanticRouter::kHashField)->value == routes_hash(updated));
}

TEST_CASE("Sync rewrites payloads when only the schema or metadata changed", "[routing][router]") {
    Fixture f;
    auto catalog = small_catalog();
    catalog[0].function_schema = json{{"name", "refund"}};
    REQUIRE(f.router(catalog).sync().has_value());

    catalog[0].function_schema = json{{"name", "refund_v2"}};
    catalog[1].metadata = json{{"tone", "casual"}};

    auto report = f.router(catalog).sync();
    REQUIRE(report.has_value());
    CHECK(report->added == 0);
    CHECK(report->updated == 3);
    CHECK(report->removed == 0);
    CHECK(report->unchanged == 0);

    const auto& docs = f.backend->collections.at("routes").documents;
    CHECK(docs.at(index::make_record_id("billing", "I need a refund"))[index::kSchemaField] ==
          R"({"name":"refund_v2"})");
    CHECK(docs.at(index::make_record_id("chitchat", "lovely weather today"))[index::kMetadataField] ==
          R"({"tone":"casual"})");
    CHECK(f.idx->read_config(SemanticRouter::kHashField)->value == routes_hash(catalog));

    auto again = f.router(catalog).sync();
    REQUIRE(again.has_value());
    CHECK(again->skipped);
}

TEST_CASE("Sync leaves matching payloads alone after a hash reset", "[routing][router]") {
    Fixture f;
    auto catalog = small_catalog();
    catalog[1].metadata = json{{"tone", "casual"}};
    REQUIRE(f.router(catalog).sync().has_value());
    REQUIRE(f.idx->write_config({.field = std::string(SemanticRouter::kHashField), .value = "stale"})
                .has_value());

    auto report = f.router(catalog).sync();
    REQUIRE(report.has_value());
    CHECK_FALSE(report->skipped);
    CHECK(report->added == 0);
    CHECK(report->updated == 0);
    CHECK(report->unchanged == 3);
    CHECK(f.encoder->batch_calls == 1);
}

TEST_CASE("route picks the nearest label", "[routing][router]") {
    Fixture f;
    auto router = f.router(small_catalog());
    REQUIRE(router.sync().has_value());

    auto choice = router.route("can I get a refund");
    REQUIRE(choice.has_value());
    CHECK(choice->name == "billing");
    REQUIRE(choice->similarity_score.has_value());
    CHECK(*choice->similarity_score > 0.9);

    auto batch = router.route_batch({"what's the weather like", "invoice copy please"});
    REQUIRE(batch.has_value());
    REQUIRE(batch->size() == 2);
    CHECK((*batch)[0].name == "chitchat");
    CHECK((*batch)[1].name == "billing");
}

TEST_CASE("route below the threshold yields no choice", "[routing][router]") {
    Fixture f;
    auto router = f.router(small_catalog(), RouterOptions{.top_k = 3, .score_threshold = 0.9});
    REQUIRE(router.sync().has_value());

    auto choice = router.route("something unrelated");
    REQUIRE(choice.has_value());
    CHECK_FALSE(choice->name.has_value());
    CHECK_FALSE(choice->similarity_score.has_value());
}

TEST_CASE("route before any sync reports the missing index", "[routing][router]") {
    Fixture f;
    auto router = f.router(small_catalog());

    auto choice = router.route("refund");
    REQUIRE_FALSE(choice.has_value());
    CHECK(choice.error().code() == ErrorCode::NotFound);
}

TEST_CASE("Sync with no routes leaves the index empty", "[routing][router]") {
    Fixture f;
    auto report = f.router({}).sync();
    REQUIRE(report.has_value());
    CHECK(report->added == 0);
    CHECK(f.backend->collections.empty());
}
