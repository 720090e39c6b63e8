#include "semroute/index/typesense_index.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/index/document.hpp"

namespace semroute::index {

TypesenseIndex::TypesenseIndex(const TypesenseConfig& config)
    : TypesenseIndex(typesense::make_transport(config), config.collection) {
    LOG_INFO("Typesense index on {} (collection '{}')",
             config.base_url(), config.collection);
}

TypesenseIndex::TypesenseIndex(std::shared_ptr<infra::HttpTransport> transport,
                               std::string collection)
    : client_(std::move(transport), std::move(collection)),
      schema_(client_),
      writer_(client_, schema_),
      translator_(client_),
      paginator_(client_),
      config_store_(client_) {}

TypesenseIndex::~TypesenseIndex() = default;

auto TypesenseIndex::add(const AddBatch& batch) -> Result<size_t> {
    auto written = writer_.add(batch);
    if (written && !batch.embeddings.empty()) {
        dimensions_ = batch.embeddings.front().size();
    }
    return written;
}

auto TypesenseIndex::remove(std::string_view label) -> Result<size_t> {
    return writer_.delete_by_label(label);
}

auto TypesenseIndex::delete_all() -> VoidResult {
    auto dropped = writer_.delete_collection();
    if (dropped) {
        dimensions_.reset();
    }
    return dropped;
}

auto TypesenseIndex::delete_index() -> VoidResult {
    return delete_all();
}

auto TypesenseIndex::delete_records(const LabelTexts& records) -> VoidResult {
    return writer_.delete_records(records);
}

auto TypesenseIndex::describe() -> IndexConfig {
    IndexConfig config{.type = std::string(kType)};

    auto info = client_.retrieve_collection();
    if (!info) {
        if (!is_not_found(info.error())) {
            LOG_WARN("describe: {}", info.error().what());
        }
        return config;
    }

    config.dimensions = dimensions_.value_or(
        info->vector_dimensions(kVectorField).value_or(0));
    config.vectors = info->num_documents;
    return config;
}

auto TypesenseIndex::is_ready() -> bool {
    auto info = client_.retrieve_collection();
    if (!info) {
        LOG_DEBUG("Index not ready: {}", info.error().what());
        return false;
    }
    return true;
}

auto TypesenseIndex::size() -> size_t {
    auto info = client_.retrieve_collection();
    if (!info) {
        if (!is_not_found(info.error())) {
            LOG_WARN("size: {}", info.error().what());
        }
        return 0;
    }
    return info->num_documents;
}

auto TypesenseIndex::query(const std::vector<float>& vector, size_t top_k,
                           const std::vector<std::string>& label_filter)
    -> Result<QueryResult> {
    return translator_.search(vector, top_k, label_filter);
}

auto TypesenseIndex::enumerate_all(std::optional<std::string> prefix,
                                   bool include_metadata) -> Result<Corpus> {
    auto corpus = paginator_.enumerate_all(prefix, include_metadata);
    if (!corpus && is_not_found(corpus.error())) {
        return Corpus{};
    }
    return corpus;
}

auto TypesenseIndex::read_config(std::string_view field, std::optional<std::string> scope)
    -> Result<ConfigParameter> {
    return config_store_.read(field, std::move(scope));
}

auto TypesenseIndex::write_config(const ConfigParameter& config)
    -> Result<ConfigParameter> {
    auto dims = resolve_dimensions();
    if (!dims) {
        return std::unexpected(dims.error());
    }
    return config_store_.write(config, *dims);
}

auto TypesenseIndex::init_index() -> VoidResult {
    if (!dimensions_) {
        return {};
    }
    return schema_.ensure_collection(*dimensions_);
}

auto TypesenseIndex::resolve_dimensions() -> Result<size_t> {
    if (dimensions_) {
        return *dimensions_;
    }

    auto info = client_.retrieve_collection();
    if (!info) {
        if (is_not_found(info.error())) {
            return size_t{1};
        }
        return std::unexpected(info.error());
    }
    if (auto stored = info->vector_dimensions(kVectorField)) {
        dimensions_ = *stored;
        return *stored;
    }
    return size_t{1};
}

} // namespace semroute::index
