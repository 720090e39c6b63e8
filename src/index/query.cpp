#include "semroute/index/query.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

#include <algorithm>
#include <format>

namespace semroute::index {

auto render_vector_query(std::string_view field, const std::vector<float>& vector,
                         size_t k) -> std::string {
    std::string out(field);
    out += ":([";
    for (size_t i = 0; i < vector.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("{}", vector[i]);
    }
    out += std::format("], k:{})", k);
    return out;
}

auto render_label_filter(const std::vector<std::string>& labels) -> std::string {
    std::string out;
    for (const auto& label : labels) {
        if (!out.empty()) out += " || ";
        out += label_equals(label);
    }
    return out;
}

QueryTranslator::QueryTranslator(typesense::Client& client)
    : client_(client) {}

auto QueryTranslator::build_params(const std::vector<float>& vector, size_t top_k,
                                   const std::vector<std::string>& label_filter)
    -> typesense::SearchParams {
    typesense::SearchParams params;
    params.q = "*";
    const auto k = std::clamp<size_t>(top_k, 1, kMaxPerPage);
    params.vector_query = render_vector_query(kVectorField, vector, k);
    params.per_page = k;
    params.page = 1;
    params.exclude_fields = kVectorField;
    // Configuration pseudo-records share the collection; an allow-list
    // already excludes them, otherwise they are filtered out explicitly.
    params.filter_by = label_filter.empty() ? label_not_equals(kConfigLabel)
                                            : render_label_filter(label_filter);
    return params;
}

auto QueryTranslator::search(const std::vector<float>& vector, size_t top_k,
                             const std::vector<std::string>& label_filter)
    -> Result<QueryResult> {
    if (top_k == 0) {
        return QueryResult{};
    }
    if (top_k > kMaxPerPage) {
        LOG_WARN("top_k {} exceeds the backend page limit, clamping to {}",
                 top_k, kMaxPerPage);
    }

    auto response = client_.search(build_params(vector, top_k, label_filter));
    if (!response) {
        return std::unexpected(response.error());
    }

    QueryResult results;
    results.reserve(response->hits.size());
    for (const auto& hit : response->hits) {
        double distance = hit.vector_distance.value_or(kMaxCosineDistance);
        results.push_back(ScoredLabel{
            .score = distance_to_similarity(distance),
            .label = from_document(hit.document).label,
        });
    }
    return results;
}

} // namespace semroute::index
