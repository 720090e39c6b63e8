#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "semroute/core/error.hpp"

namespace semroute::index {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Summary reported by describe(). Absence of the collection is the
/// all-zero descriptor, not an error.
struct IndexConfig {
    std::string type;
    size_t dimensions = 0;
    size_t vectors = 0;
};

/// One search hit: similarity in [-1, 1] and the label it belongs to.
struct ScoredLabel {
    double score = 0.0;
    std::string label;
};

/// Hits ordered by descending similarity.
using QueryResult = std::vector<ScoredLabel>;

/// A named configuration value persisted alongside the routes.
struct ConfigParameter {
    std::string field;
    std::string value;
    std::optional<std::string> scope;
};

/// Every stored route record: parallel lists of ids and metadata objects
/// (sr_route, sr_utterance, sr_function_schema, plus free-form metadata
/// when requested).
struct Corpus {
    std::vector<std::string> ids;
    std::vector<json> metadata;
};

/// label -> texts, as consumed by delete_records().
using LabelTexts = std::map<std::string, std::set<std::string>>;

/// Input to add(). labels and texts run parallel to embeddings;
/// function_schemas and metadata may be shorter (or empty), missing entries
/// default to null / {}.
struct AddBatch {
    std::vector<std::vector<float>> embeddings;
    std::vector<std::string> labels;
    std::vector<std::string> texts;
    std::vector<json> function_schemas;
    std::vector<json> metadata;
};

/// Storage contract the semantic router indexes its routes through.
///
/// Introspection calls (describe, is_ready, size) never fail; they degrade to
/// zero values. Writes propagate every error. Each async_* variant delegates
/// to its synchronous counterpart.
class RouteIndex {
public:
    virtual ~RouteIndex() = default;

    virtual auto add(const AddBatch& batch) -> Result<size_t> = 0;
    virtual auto remove(std::string_view label) -> Result<size_t> = 0;
    virtual auto delete_all() -> VoidResult = 0;
    virtual auto delete_index() -> VoidResult = 0;
    virtual auto delete_records(const LabelTexts& records) -> VoidResult = 0;

    [[nodiscard]] virtual auto describe() -> IndexConfig = 0;
    [[nodiscard]] virtual auto is_ready() -> bool = 0;
    [[nodiscard]] virtual auto size() -> size_t = 0;

    virtual auto query(const std::vector<float>& vector, size_t top_k,
                       const std::vector<std::string>& label_filter = {})
        -> Result<QueryResult> = 0;

    virtual auto enumerate_all(std::optional<std::string> prefix = std::nullopt,
                               bool include_metadata = false) -> Result<Corpus> = 0;

    virtual auto read_config(std::string_view field,
                             std::optional<std::string> scope = std::nullopt)
        -> Result<ConfigParameter> = 0;
    virtual auto write_config(const ConfigParameter& config)
        -> Result<ConfigParameter> = 0;

    auto async_add(AddBatch batch) -> awaitable<Result<size_t>>;
    auto async_remove(std::string label) -> awaitable<Result<size_t>>;
    auto async_delete_all() -> awaitable<VoidResult>;
    auto async_delete_index() -> awaitable<VoidResult>;
    auto async_delete_records(LabelTexts records) -> awaitable<VoidResult>;
    auto async_describe() -> awaitable<IndexConfig>;
    auto async_is_ready() -> awaitable<bool>;
    auto async_query(std::vector<float> vector, size_t top_k,
                     std::vector<std::string> label_filter = {})
        -> awaitable<Result<QueryResult>>;
    auto async_enumerate_all(std::optional<std::string> prefix = std::nullopt,
                             bool include_metadata = false)
        -> awaitable<Result<Corpus>>;
    auto async_read_config(std::string field,
                           std::optional<std::string> scope = std::nullopt)
        -> awaitable<Result<ConfigParameter>>;
    auto async_write_config(ConfigParameter config)
        -> awaitable<Result<ConfigParameter>>;
};

} // namespace semroute::index
