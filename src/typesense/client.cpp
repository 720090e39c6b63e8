#include "semroute/typesense/client.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/core/utils.hpp"

#include <sstream>

namespace semroute::typesense {

namespace {

auto parse_body(const infra::HttpResponse& response, std::string_view what)
    -> Result<json> {
    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Malformed response to " + std::string(what), e.what()));
    }
}

// Field access on a decoded body throws json::type_error when the backend
// sends an unexpected shape; callers map it with decode_error().
auto parse_hit(const json& j) -> std::optional<SearchHit> {
    SearchHit hit;
    hit.document = j.value("document", json::object());
    if (!hit.document.is_object()) {
        return std::nullopt;
    }
    if (j.contains("vector_distance") && j["vector_distance"].is_number()) {
        hit.vector_distance = j["vector_distance"].get<double>();
    }
    return hit;
}

auto decode_error(std::string_view what, const json::exception& e) -> Error {
    return make_error(ErrorCode::ProtocolError,
                      "Unexpected response shape for " + std::string(what), e.what());
}

auto decode_collection(const json& body, std::string_view what) -> Result<CollectionInfo> {
    try {
        return body.get<CollectionInfo>();
    } catch (const json::exception& e) {
        return std::unexpected(decode_error(what, e));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

auto CollectionInfo::vector_dimensions(std::string_view field) const
    -> std::optional<size_t> {
    if (!fields.is_array()) {
        return std::nullopt;
    }
    for (const auto& f : fields) {
        if (!f.is_object()) continue;
        auto name = f.find("name");
        auto num_dim = f.find("num_dim");
        if (name == f.end() || num_dim == f.end()) continue;
        if (name->is_string() && name->get<std::string>() == field &&
            num_dim->is_number_unsigned()) {
            return num_dim->get<size_t>();
        }
    }
    return std::nullopt;
}

void from_json(const json& j, CollectionInfo& info) {
    info.name = j.value("name", "");
    info.num_documents = j.value("num_documents", size_t{0});
    info.fields = j.value("fields", json::array());
    if (!info.fields.is_array()) {
        info.fields = json::array();
    }
}

auto import_action_to_string(ImportAction action) -> std::string_view {
    switch (action) {
        case ImportAction::Create: return "create";
        case ImportAction::Upsert: return "upsert";
        case ImportAction::Update: return "update";
        case ImportAction::Emplace: return "emplace";
    }
    return "create";
}

auto status_error(const infra::HttpResponse& response, std::string_view what) -> Error {
    std::string detail = "HTTP " + std::to_string(response.status);
    try {
        auto body = json::parse(response.body);
        if (body.is_object() && body.contains("message")) {
            detail += ": " + body["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        if (!response.body.empty()) {
            detail += ": " + response.body;
        }
    }

    auto code = ErrorCode::BackendError;
    switch (response.status) {
        case 400:
        case 422: code = ErrorCode::InvalidArgument; break;
        case 401:
        case 403: code = ErrorCode::Unauthorized; break;
        case 404: code = ErrorCode::NotFound; break;
        case 409: code = ErrorCode::AlreadyExists; break;
        default: break;
    }
    return make_error(code, std::string(what) + " failed", std::move(detail));
}

auto make_transport(const TypesenseConfig& config)
    -> std::shared_ptr<infra::HttpTransport> {
    return std::make_shared<infra::HttpClient>(infra::HttpClientConfig{
        .base_url = config.base_url(),
        .timeout_seconds = config.connection_timeout_seconds,
        .verify_ssl = true,
        .default_headers = {
            {std::string(kApiKeyHeader), config.api_key},
        },
    });
}

// ---------------------------------------------------------------------------
// Client
// ---------------------------------------------------------------------------

Client::Client(std::shared_ptr<infra::HttpTransport> transport, std::string collection)
    : transport_(std::move(transport)), collection_(std::move(collection)) {}

auto Client::collection_path() const -> std::string {
    return "/collections/" + utils::url_encode(collection_);
}

auto Client::document_path(std::string_view id) const -> std::string {
    return collection_path() + "/documents/" + utils::url_encode(id);
}

auto Client::exchange(infra::HttpRequest request, std::string_view what)
    -> Result<infra::HttpResponse> {
    auto response = transport_->send(request);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->is_success()) {
        return std::unexpected(status_error(*response, what));
    }
    return response;
}

auto Client::retrieve_collection() -> Result<CollectionInfo> {
    auto response = exchange({.method = "GET", .path = collection_path()},
                             "Retrieve collection");
    if (!response) return std::unexpected(response.error());

    auto body = parse_body(*response, "collection retrieve");
    if (!body) return std::unexpected(body.error());
    return decode_collection(*body, "collection retrieve");
}

auto Client::create_collection(const json& schema) -> Result<CollectionInfo> {
    auto response = exchange({.method = "POST",
                              .path = "/collections",
                              .body = schema.dump()},
                             "Create collection");
    if (!response) return std::unexpected(response.error());

    auto body = parse_body(*response, "collection create");
    if (!body) return std::unexpected(body.error());
    return decode_collection(*body, "collection create");
}

auto Client::delete_collection() -> VoidResult {
    auto response = exchange({.method = "DELETE", .path = collection_path()},
                             "Delete collection");
    if (!response) return std::unexpected(response.error());
    return {};
}

auto Client::import_documents(const std::vector<json>& documents, ImportAction action)
    -> Result<size_t> {
    if (documents.empty()) {
        return size_t{0};
    }

    std::string jsonl;
    for (const auto& doc : documents) {
        jsonl += doc.dump();
        jsonl += '\n';
    }

    auto response = exchange(
        {.method = "POST",
         .path = collection_path() + "/documents/import",
         .params = {{"action", std::string(import_action_to_string(action))}},
         .body = std::move(jsonl),
         .content_type = "text/plain"},
        "Import documents");
    if (!response) return std::unexpected(response.error());

    size_t imported = 0;
    std::istringstream lines(response->body);
    std::string line;
    while (std::getline(lines, line)) {
        if (utils::trim(line).empty()) continue;
        try {
            auto result = json::parse(line);
            if (!result.value("success", false)) {
                return std::unexpected(
                    make_error(ErrorCode::BackendError,
                               "Document import rejected",
                               result.value("error", std::string("unknown error"))));
            }
            ++imported;
        } catch (const json::exception& e) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError,
                           "Malformed import response line", e.what()));
        }
    }
    return imported;
}

auto Client::delete_documents(std::string_view filter_by) -> Result<size_t> {
    auto response = exchange(
        {.method = "DELETE",
         .path = collection_path() + "/documents",
         .params = {{"filter_by", std::string(filter_by)}}},
        "Delete documents");
    if (!response) return std::unexpected(response.error());

    auto body = parse_body(*response, "document delete");
    if (!body) return std::unexpected(body.error());
    try {
        return body->value("num_deleted", size_t{0});
    } catch (const json::exception& e) {
        return std::unexpected(decode_error("document delete", e));
    }
}

auto Client::retrieve_document(std::string_view id) -> Result<json> {
    auto response = exchange({.method = "GET", .path = document_path(id)},
                             "Retrieve document");
    if (!response) return std::unexpected(response.error());
    return parse_body(*response, "document retrieve");
}

auto Client::delete_document(std::string_view id) -> VoidResult {
    auto response = exchange({.method = "DELETE", .path = document_path(id)},
                             "Delete document");
    if (!response) return std::unexpected(response.error());
    return {};
}

auto Client::upsert_document(const json& document) -> Result<json> {
    auto response = exchange({.method = "POST",
                              .path = collection_path() + "/documents",
                              .params = {{"action", "upsert"}},
                              .body = document.dump()},
                             "Upsert document");
    if (!response) return std::unexpected(response.error());
    return parse_body(*response, "document upsert");
}

auto Client::search(const SearchParams& params) -> Result<SearchResponse> {
    // Vector clauses can exceed the GET parameter limit, so searches go
    // through the multi-search endpoint with the parameters in the body.
    json search = {
        {"collection", collection_},
        {"q", params.q},
        {"page", params.page},
        {"per_page", params.per_page},
    };
    if (params.query_by) search["query_by"] = *params.query_by;
    if (params.vector_query) search["vector_query"] = *params.vector_query;
    if (params.filter_by) search["filter_by"] = *params.filter_by;
    if (params.exclude_fields) search["exclude_fields"] = *params.exclude_fields;

    json request = {{"searches", json::array({search})}};

    auto response = exchange({.method = "POST",
                              .path = "/multi_search",
                              .body = request.dump()},
                             "Search documents");
    if (!response) return std::unexpected(response.error());

    auto body = parse_body(*response, "search");
    if (!body) return std::unexpected(body.error());

    SearchResponse out;
    try {
        const auto& results = body->at("results");
        if (!results.is_array() || results.empty()) {
            return std::unexpected(
                make_error(ErrorCode::ProtocolError, "Search response missing results"));
        }

        const auto& result = results[0];
        if (result.contains("error")) {
            // Per-search failures are reported inline with their HTTP code.
            infra::HttpResponse inline_error{
                .status = result.value("code", 500),
                .body = json{{"message", result["error"]}}.dump(),
            };
            return std::unexpected(status_error(inline_error, "Search documents"));
        }

        out.found = result.value("found", size_t{0});
        out.page = result.value("page", params.page);
        for (const auto& hit : result.value("hits", json::array())) {
            auto parsed = parse_hit(hit);
            if (!parsed) {
                return std::unexpected(
                    make_error(ErrorCode::ProtocolError, "Search hit without a document object"));
            }
            out.hits.push_back(std::move(*parsed));
        }
    } catch (const json::exception& e) {
        return std::unexpected(decode_error("search", e));
    }
    LOG_DEBUG("Search page {} of '{}' returned {} hits (found {})",
              out.page, collection_, out.hits.size(), out.found);
    return out;
}

} // namespace semroute::typesense
