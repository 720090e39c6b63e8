#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "semroute/core/config.hpp"
#include "semroute/core/error.hpp"
#include "semroute/infra/http_client.hpp"

namespace semroute::typesense {

using json = nlohmann::json;

/// Header carrying the backend API key.
inline constexpr std::string_view kApiKeyHeader = "X-TYPESENSE-API-KEY";

/// Collection metadata as returned by the collection retrieve endpoint.
struct CollectionInfo {
    std::string name;
    size_t num_documents = 0;
    json fields = json::array();

    /// num_dim of the named float[] field, if the schema declares one.
    [[nodiscard]] auto vector_dimensions(std::string_view field) const
        -> std::optional<size_t>;
};

void from_json(const json& j, CollectionInfo& info);

enum class ImportAction { Create, Upsert, Update, Emplace };

auto import_action_to_string(ImportAction action) -> std::string_view;

struct SearchParams {
    std::string q = "*";
    std::optional<std::string> query_by;
    std::optional<std::string> vector_query;
    std::optional<std::string> filter_by;
    std::optional<std::string> exclude_fields;
    size_t page = 1;
    size_t per_page = 10;
};

struct SearchHit {
    json document;
    std::optional<double> vector_distance;
};

struct SearchResponse {
    size_t found = 0;
    size_t page = 0;
    std::vector<SearchHit> hits;
};

/// Creates the production transport for a backend node, with the API key
/// attached as a default header.
auto make_transport(const TypesenseConfig& config)
    -> std::shared_ptr<infra::HttpTransport>;

/// Typed client for one collection of the search backend's REST API.
///
/// Every call is a single blocking request. HTTP statuses are mapped to
/// error codes: 404 NotFound, 409 AlreadyExists, 401/403 Unauthorized,
/// 400/422 InvalidArgument, anything else BackendError.
class Client {
public:
    Client(std::shared_ptr<infra::HttpTransport> transport, std::string collection);

    [[nodiscard]] auto collection() const noexcept -> const std::string& { return collection_; }

    auto retrieve_collection() -> Result<CollectionInfo>;
    auto create_collection(const json& schema) -> Result<CollectionInfo>;
    auto delete_collection() -> VoidResult;

    /// Bulk import as JSONL. Fails with the first per-document error if any
    /// line of the response reports success:false. Returns the number of
    /// documents imported.
    auto import_documents(const std::vector<json>& documents, ImportAction action)
        -> Result<size_t>;

    /// Deletes every document matching the filter expression; returns the
    /// number deleted.
    auto delete_documents(std::string_view filter_by) -> Result<size_t>;

    auto retrieve_document(std::string_view id) -> Result<json>;
    auto delete_document(std::string_view id) -> VoidResult;
    auto upsert_document(const json& document) -> Result<json>;

    auto search(const SearchParams& params) -> Result<SearchResponse>;

private:
    auto collection_path() const -> std::string;
    auto document_path(std::string_view id) const -> std::string;
    auto exchange(infra::HttpRequest request, std::string_view what)
        -> Result<infra::HttpResponse>;

    std::shared_ptr<infra::HttpTransport> transport_;
    std::string collection_;
};

/// Maps a non-2xx response to an Error, using the backend's "message" field
/// as the detail when present.
auto status_error(const infra::HttpResponse& response, std::string_view what) -> Error;

} // namespace semroute::typesense
