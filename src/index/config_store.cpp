#include "semroute/index/config_store.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

#include <vector>

namespace semroute::index {

ConfigStore::ConfigStore(typesense::Client& client)
    : client_(client) {}

auto ConfigStore::config_id(std::string_view field) -> std::string {
    return std::string(kConfigLabel) + std::string(field);
}

auto ConfigStore::read(std::string_view field, std::optional<std::string> scope)
    -> Result<ConfigParameter> {
    ConfigParameter param{.field = std::string(field), .value = "", .scope = std::move(scope)};

    auto doc = client_.retrieve_document(config_id(field));
    if (!doc) {
        if (is_not_found(doc.error())) {
            LOG_DEBUG("Config '{}' not stored yet", field);
            return param;
        }
        return std::unexpected(doc.error());
    }

    param.value = from_document(*doc).text;
    return param;
}

auto ConfigStore::write(const ConfigParameter& config, size_t dimensions)
    -> Result<ConfigParameter> {
    auto id = config_id(config.field);
    json doc = {
        {"id", id},
        {kIdField, id},
        {kLabelField, std::string(kConfigLabel)},
        {kTextField, config.value},
        {kSchemaField, "{}"},
        {kMetadataField, "{}"},
        {kVectorField, std::vector<float>(dimensions == 0 ? 1 : dimensions, 0.0f)},
    };

    auto written = client_.upsert_document(doc);
    if (!written) {
        return std::unexpected(written.error());
    }
    LOG_DEBUG("Stored config '{}'", config.field);
    return config;
}

} // namespace semroute::index
