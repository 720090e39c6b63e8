#pragma once

#include <cstddef>
#include <string_view>

#include "semroute/core/error.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/index/schema_manager.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

/// Write path: bulk upsert, label-filtered delete, per-record delete and
/// collection drop. Every operation is idempotent; all failures other than
/// the not-found cases documented below propagate.
class BatchWriter {
public:
    BatchWriter(typesense::Client& client, SchemaManager& schema);

    /// Maps every tuple, ensures the collection exists at the width of the
    /// first embedding, then upserts the whole batch in one request.
    /// Returns the number of documents written.
    auto add(const AddBatch& batch) -> Result<size_t>;

    /// Backend-side filtered delete of every record under the label.
    auto delete_by_label(std::string_view label) -> Result<size_t>;

    /// Drops the collection. Already absent is success.
    auto delete_collection() -> VoidResult;

    /// Deletes the listed (label, text) records by recomputed id. Records
    /// that are already absent are skipped.
    auto delete_records(const LabelTexts& records) -> VoidResult;

private:
    typesense::Client& client_;
    SchemaManager& schema_;
};

} // namespace semroute::index
