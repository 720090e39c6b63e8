#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "semroute/core/error.hpp"
#include "semroute/encoders/embedding_provider.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/routing/route.hpp"

namespace semroute::routing {

struct RouterOptions {
    size_t top_k = 5;
    double score_threshold = 0.0;
};

/// Outcome of a sync pass. skipped means the stored hash already matched.
/// updated counts utterances whose schema or metadata was rewritten.
struct SyncReport {
    size_t added = 0;
    size_t updated = 0;
    size_t removed = 0;
    size_t unchanged = 0;
    bool skipped = false;
};

/// Best route for a query, or neither field when nothing qualified.
struct RouteChoice {
    std::optional<std::string> name;
    std::optional<double> similarity_score;
};

/// Routes text to the nearest indexed utterance's label and keeps the remote
/// index in step with the local route definitions.
class SemanticRouter {
public:
    static constexpr std::string_view kHashField = "routes_hash";

    SemanticRouter(std::shared_ptr<encoders::EmbeddingProvider> encoder,
                   std::shared_ptr<index::RouteIndex> index,
                   std::vector<Route> routes,
                   RouterOptions options = {});

    /// Local definitions win. Compares the stored routes hash with the local
    /// one; on drift, deletes remote utterances that are no longer defined,
    /// embeds and adds the missing ones, re-upserts those whose schema or
    /// metadata changed, then stores the new hash.
    auto sync() -> Result<SyncReport>;

    auto route(std::string_view text) -> Result<RouteChoice>;
    auto route_batch(const std::vector<std::string>& texts) -> Result<std::vector<RouteChoice>>;

    [[nodiscard]] auto routes() const noexcept -> const std::vector<Route>& { return routes_; }
    [[nodiscard]] auto index() noexcept -> index::RouteIndex& { return *index_; }

private:
    std::shared_ptr<encoders::EmbeddingProvider> encoder_;
    std::shared_ptr<index::RouteIndex> index_;
    std::vector<Route> routes_;
    RouterOptions options_;
};

} // namespace semroute::routing
