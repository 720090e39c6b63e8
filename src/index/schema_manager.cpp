#include "semroute/index/schema_manager.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

namespace semroute::index {

SchemaManager::SchemaManager(typesense::Client& client)
    : client_(client) {}

auto SchemaManager::collection_schema(std::string_view name, size_t dimensions)
    -> nlohmann::json {
    using nlohmann::json;
    return json{
        {"name", std::string(name)},
        {"fields", json::array({
            json{{"name", kIdField}, {"type", "string"}},
            json{{"name", kLabelField}, {"type", "string"}, {"facet", true}},
            json{{"name", kTextField}, {"type", "string"}},
            json{{"name", kSchemaField}, {"type", "string"}, {"optional", true}},
            json{{"name", kMetadataField}, {"type", "string"}, {"optional", true}},
            json{{"name", kVectorField}, {"type", "float[]"}, {"num_dim", dimensions}},
        })},
    };
}

auto SchemaManager::exists() -> Result<bool> {
    auto info = client_.retrieve_collection();
    if (info) {
        return true;
    }
    if (is_not_found(info.error())) {
        return false;
    }
    return std::unexpected(info.error());
}

auto SchemaManager::ensure_collection(size_t dimensions) -> VoidResult {
    auto present = exists();
    if (!present) {
        return std::unexpected(present.error());
    }
    if (*present) {
        LOG_DEBUG("Collection '{}' already exists", client_.collection());
        return {};
    }

    auto created = client_.create_collection(
        collection_schema(client_.collection(), dimensions));
    if (!created) {
        if (created.error().code() == ErrorCode::AlreadyExists) {
            LOG_INFO("Collection '{}' was created concurrently", client_.collection());
            return {};
        }
        return std::unexpected(created.error());
    }

    LOG_INFO("Created collection '{}' with {} dimensions",
             client_.collection(), dimensions);
    return {};
}

} // namespace semroute::index
