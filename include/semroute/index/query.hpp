#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "semroute/core/error.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

/// Cosine distance reported by the backend ranges over [0, 2].
inline constexpr double kMaxCosineDistance = 2.0;

/// Largest page the backend serves in one search.
inline constexpr size_t kMaxPerPage = 250;

/// similarity = 1 - distance / 2. Monotonically decreasing, so nearest-first
/// order is descending-similarity order.
[[nodiscard]] constexpr auto distance_to_similarity(double distance) noexcept -> double {
    return 1.0 - distance / kMaxCosineDistance;
}

/// `field:([v1,...,vn], k:N)`
auto render_vector_query(std::string_view field, const std::vector<float>& vector,
                         size_t k) -> std::string;

/// OR of label equalities; empty for an empty list.
auto render_label_filter(const std::vector<std::string>& labels) -> std::string;

/// Nearest-neighbour search over the vector field.
class QueryTranslator {
public:
    explicit QueryTranslator(typesense::Client& client);

    /// Top-k hits ordered by descending similarity. A non-empty label filter
    /// is applied by the backend, and configuration records never match.
    /// Hits without a distance score as the minimum similarity.
    auto search(const std::vector<float>& vector, size_t top_k,
                const std::vector<std::string>& label_filter = {})
        -> Result<QueryResult>;

    [[nodiscard]] static auto build_params(const std::vector<float>& vector, size_t top_k,
                                           const std::vector<std::string>& label_filter)
        -> typesense::SearchParams;

private:
    typesense::Client& client_;
};

} // namespace semroute::index
