#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "semroute/core/error.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

inline constexpr size_t kScanPageSize = 250;

/// Walks the whole collection with wildcard searches, one page at a time,
/// starting at page 1 and stopping at the first empty page.
///
/// A page whose every id was already seen also stops the scan, so a backend
/// that keeps serving stale content cannot loop it forever. Configuration
/// pseudo-records are skipped.
class FullScanPaginator {
public:
    explicit FullScanPaginator(typesense::Client& client, size_t page_size = kScanPageSize);

    /// Ids and metadata objects of every route record. With
    /// include_metadata, decoded free-form metadata is merged into each
    /// object; undecodable metadata is dropped and the scan continues.
    /// A prefix keeps only ids that start with it.
    auto enumerate_all(const std::optional<std::string>& prefix = std::nullopt,
                       bool include_metadata = false) -> Result<Corpus>;

    /// Page requests issued by the last enumerate_all().
    [[nodiscard]] auto pages_fetched() const noexcept -> size_t { return pages_fetched_; }

private:
    typesense::Client& client_;
    size_t page_size_;
    size_t pages_fetched_ = 0;
};

} // namespace semroute::index
