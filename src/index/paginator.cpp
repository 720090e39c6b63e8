#include "semroute/index/paginator.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

#include <unordered_set>

namespace semroute::index {

FullScanPaginator::FullScanPaginator(typesense::Client& client, size_t page_size)
    : client_(client), page_size_(page_size) {}

auto FullScanPaginator::enumerate_all(const std::optional<std::string>& prefix,
                                      bool include_metadata) -> Result<Corpus> {
    Corpus corpus;
    std::unordered_set<std::string> seen;
    pages_fetched_ = 0;

    typesense::SearchParams params;
    params.q = "*";
    params.per_page = page_size_;
    params.exclude_fields = kVectorField;

    for (size_t page = 1;; ++page) {
        params.page = page;
        auto response = client_.search(params);
        ++pages_fetched_;
        if (!response) {
            return std::unexpected(response.error());
        }
        if (response->hits.empty()) {
            break;
        }

        size_t fresh = 0;
        for (const auto& hit : response->hits) {
            auto record = from_document(hit.document);
            if (!seen.insert(record.id).second) {
                continue;
            }
            ++fresh;

            if (record.label == kConfigLabel) continue;
            if (prefix && !record.id.starts_with(*prefix)) continue;

            json meta = {
                {kLabelField, record.label},
                {kTextField, record.text},
                {kSchemaField, record.structured_schema.format == PayloadFormat::Absent
                                   ? std::string("{}")
                                   : record.structured_schema.raw},
            };

            if (include_metadata) {
                auto extra = decode_payload(record.metadata);
                if (!extra) {
                    LOG_WARN("Dropping metadata of record {}: {}",
                             record.id, extra.error().what());
                } else if (extra->is_object()) {
                    meta.update(*extra);
                }
            }

            corpus.ids.push_back(std::move(record.id));
            corpus.metadata.push_back(std::move(meta));
        }

        if (fresh == 0) {
            LOG_WARN("Page {} of '{}' repeated earlier results, stopping scan",
                     page, client_.collection());
            break;
        }
    }

    LOG_DEBUG("Enumerated {} records from '{}' in {} pages",
              corpus.ids.size(), client_.collection(), pages_fetched_);
    return corpus;
}

} // namespace semroute::index
