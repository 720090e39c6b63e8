#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "semroute/core/config.hpp"
#include "semroute/index/batch_writer.hpp"
#include "semroute/index/config_store.hpp"
#include "semroute/index/paginator.hpp"
#include "semroute/index/query.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/index/schema_manager.hpp"
#include "semroute/infra/http_client.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

/// RouteIndex backed by a single Typesense collection.
///
/// Holds no state beyond the connection and, once a write has observed it,
/// the vector width. The collection is the only source of truth.
class TypesenseIndex : public RouteIndex {
public:
    static constexpr std::string_view kType = "typesense";

    /// Connects to the node described by the configuration.
    explicit TypesenseIndex(const TypesenseConfig& config);

    /// Uses an existing transport; the collection name selects the target.
    TypesenseIndex(std::shared_ptr<infra::HttpTransport> transport, std::string collection);

    ~TypesenseIndex() override;

    TypesenseIndex(const TypesenseIndex&) = delete;
    TypesenseIndex& operator=(const TypesenseIndex&) = delete;

    auto add(const AddBatch& batch) -> Result<size_t> override;
    auto remove(std::string_view label) -> Result<size_t> override;
    auto delete_all() -> VoidResult override;
    auto delete_index() -> VoidResult override;
    auto delete_records(const LabelTexts& records) -> VoidResult override;

    [[nodiscard]] auto describe() -> IndexConfig override;
    [[nodiscard]] auto is_ready() -> bool override;
    [[nodiscard]] auto size() -> size_t override;

    auto query(const std::vector<float>& vector, size_t top_k,
               const std::vector<std::string>& label_filter = {})
        -> Result<QueryResult> override;

    auto enumerate_all(std::optional<std::string> prefix = std::nullopt,
                       bool include_metadata = false) -> Result<Corpus> override;

    auto read_config(std::string_view field,
                     std::optional<std::string> scope = std::nullopt)
        -> Result<ConfigParameter> override;
    auto write_config(const ConfigParameter& config)
        -> Result<ConfigParameter> override;

    /// Creates the collection when the width is already known.
    auto init_index() -> VoidResult;

    [[nodiscard]] auto dimensions() const noexcept -> std::optional<size_t> { return dimensions_; }
    [[nodiscard]] auto collection() const noexcept -> const std::string& { return client_.collection(); }

private:
    /// Cached width, else the stored schema's, else 1.
    auto resolve_dimensions() -> Result<size_t>;

    typesense::Client client_;
    SchemaManager schema_;
    BatchWriter writer_;
    QueryTranslator translator_;
    FullScanPaginator paginator_;
    ConfigStore config_store_;
    std::optional<size_t> dimensions_;
};

} // namespace semroute::index
