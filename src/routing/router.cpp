#include "semroute/routing/router.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

#include <map>
#include <set>
#include <utility>

namespace semroute::routing {

namespace {

using Pair = std::pair<std::string, std::string>;

// True when an enumerated record still carries the route's function schema
// and metadata. Enumeration merges the decoded metadata into the object
// beside the sr_ fields.
auto payload_matches(const json& meta, const Route& route) -> bool {
    json schema = nullptr;
    if (auto it = meta.find(index::kSchemaField); it != meta.end() && it->is_string()) {
        try {
            schema = json::parse(it->get<std::string>());
        } catch (const json::exception&) {
            return false;
        }
    }
    if (schema != route.function_schema.value_or(nullptr)) {
        return false;
    }

    json stored = meta;
    stored.erase(index::kLabelField);
    stored.erase(index::kTextField);
    stored.erase(index::kSchemaField);
    return stored == (route.metadata.is_null() ? json::object() : route.metadata);
}

} // anonymous namespace

SemanticRouter::SemanticRouter(std::shared_ptr<encoders::EmbeddingProvider> encoder,
                               std::shared_ptr<index::RouteIndex> index,
                               std::vector<Route> routes,
                               RouterOptions options)
    : encoder_(std::move(encoder)),
      index_(std::move(index)),
      routes_(std::move(routes)),
      options_(options) {}

auto SemanticRouter::sync() -> Result<SyncReport> {
    SyncReport report;
    auto local_hash = routes_hash(routes_);

    auto stored = index_->read_config(kHashField);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (stored->value == local_hash) {
        LOG_INFO("Remote routes match local definitions ({})", local_hash.substr(0, 12));
        report.skipped = true;
        return report;
    }

    auto corpus = index_->enumerate_all(std::nullopt, true);
    if (!corpus) {
        return std::unexpected(corpus.error());
    }

    std::map<Pair, json> remote;
    for (const auto& meta : corpus->metadata) {
        auto record = index::from_document(meta);
        remote.emplace(Pair{std::move(record.label), std::move(record.text)}, meta);
    }

    index::AddBatch batch;
    std::set<Pair> local;
    for (const auto& route : routes_) {
        for (const auto& utterance : route.utterances) {
            if (!local.emplace(route.name, utterance).second) continue;
            auto existing = remote.find({route.name, utterance});
            if (existing != remote.end()) {
                if (payload_matches(existing->second, route)) {
                    ++report.unchanged;
                    continue;
                }
                // Same id, so the add below replaces the stored payload.
                ++report.updated;
            }
            batch.labels.push_back(route.name);
            batch.texts.push_back(utterance);
            batch.function_schemas.push_back(route.function_schema.value_or(nullptr));
            batch.metadata.push_back(route.metadata);
        }
    }

    index::LabelTexts stale;
    for (const auto& entry : remote) {
        const auto& [label, text] = entry.first;
        if (!local.contains(entry.first)) {
            stale[label].insert(text);
            ++report.removed;
        }
    }
    if (!stale.empty()) {
        if (auto deleted = index_->delete_records(stale); !deleted) {
            return std::unexpected(deleted.error());
        }
    }

    if (!batch.texts.empty()) {
        auto embeddings = encoder_->embed_batch(batch.texts);
        if (!embeddings) {
            return std::unexpected(embeddings.error());
        }
        batch.embeddings = std::move(*embeddings);

        auto added = index_->add(batch);
        if (!added) {
            return std::unexpected(added.error());
        }
        report.added = batch.texts.size() - report.updated;
    }

    // Without any record there is no collection to hold the hash.
    if (!local.empty()) {
        auto written = index_->write_config({.field = std::string(kHashField), .value = local_hash});
        if (!written) {
            return std::unexpected(written.error());
        }
    }

    LOG_INFO("Synced routes: {} added, {} updated, {} removed, {} unchanged",
             report.added, report.updated, report.removed, report.unchanged);
    return report;
}

auto SemanticRouter::route(std::string_view text) -> Result<RouteChoice> {
    auto vector = encoder_->embed(text);
    if (!vector) {
        return std::unexpected(vector.error());
    }

    auto hits = index_->query(*vector, options_.top_k);
    if (!hits) {
        return std::unexpected(hits.error());
    }
    if (hits->empty()) {
        return RouteChoice{};
    }

    const auto& best = hits->front();
    if (best.score < options_.score_threshold) {
        LOG_DEBUG("Best match '{}' ({:.3f}) below threshold {:.3f}",
                  best.label, best.score, options_.score_threshold);
        return RouteChoice{};
    }
    return RouteChoice{.name = best.label, .similarity_score = best.score};
}

auto SemanticRouter::route_batch(const std::vector<std::string>& texts)
    -> Result<std::vector<RouteChoice>> {
    std::vector<RouteChoice> choices;
    choices.reserve(texts.size());
    for (const auto& text : texts) {
        auto choice = route(text);
        if (!choice) {
            return std::unexpected(choice.error());
        }
        choices.push_back(std::move(*choice));
    }
    return choices;
}

} // namespace semroute::routing
