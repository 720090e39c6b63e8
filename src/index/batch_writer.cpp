#include "semroute/index/batch_writer.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

#include <vector>

namespace semroute::index {

BatchWriter::BatchWriter(typesense::Client& client, SchemaManager& schema)
    : client_(client), schema_(schema) {}

auto BatchWriter::add(const AddBatch& batch) -> Result<size_t> {
    const auto n = batch.embeddings.size();
    if (batch.labels.size() != n || batch.texts.size() != n) {
        return std::unexpected(
            make_error(ErrorCode::InvalidArgument,
                       "Mismatched batch lengths",
                       std::to_string(n) + " embeddings, " +
                           std::to_string(batch.labels.size()) + " labels, " +
                           std::to_string(batch.texts.size()) + " texts"));
    }
    if (n == 0) {
        return size_t{0};
    }

    std::vector<json> documents;
    documents.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        std::optional<json> schema;
        if (i < batch.function_schemas.size()) {
            schema = batch.function_schemas[i];
        }
        json metadata = i < batch.metadata.size() ? batch.metadata[i] : json::object();

        documents.push_back(to_document(make_record(
            batch.labels[i], batch.texts[i], std::move(schema),
            std::move(metadata), batch.embeddings[i])));
    }

    if (auto ensured = schema_.ensure_collection(batch.embeddings.front().size()); !ensured) {
        return std::unexpected(ensured.error());
    }

    auto imported = client_.import_documents(documents, typesense::ImportAction::Upsert);
    if (!imported) {
        return std::unexpected(imported.error());
    }

    LOG_INFO("Upserted {} documents into '{}'", *imported, client_.collection());
    return *imported;
}

auto BatchWriter::delete_by_label(std::string_view label) -> Result<size_t> {
    auto deleted = client_.delete_documents(label_equals(label));
    if (!deleted) {
        if (is_not_found(deleted.error())) {
            LOG_DEBUG("Collection '{}' absent, nothing to delete for '{}'",
                      client_.collection(), label);
            return size_t{0};
        }
        return std::unexpected(deleted.error());
    }
    LOG_INFO("Deleted route '{}' ({} documents) from '{}'",
             label, *deleted, client_.collection());
    return *deleted;
}

auto BatchWriter::delete_collection() -> VoidResult {
    auto dropped = client_.delete_collection();
    if (!dropped) {
        if (is_not_found(dropped.error())) {
            LOG_DEBUG("Collection '{}' already absent", client_.collection());
            return {};
        }
        return std::unexpected(dropped.error());
    }
    LOG_INFO("Deleted collection '{}'", client_.collection());
    return {};
}

auto BatchWriter::delete_records(const LabelTexts& records) -> VoidResult {
    size_t deleted = 0;
    for (const auto& [label, texts] : records) {
        for (const auto& text : texts) {
            auto id = make_record_id(label, text);
            auto result = client_.delete_document(id);
            if (!result) {
                if (is_not_found(result.error())) {
                    continue;
                }
                return std::unexpected(result.error());
            }
            ++deleted;
        }
    }
    LOG_INFO("Deleted {} stale records from '{}'", deleted, client_.collection());
    return {};
}

} // namespace semroute::index
