#include "semroute/index/route_index.hpp"

namespace semroute::index {

// Coroutine parameters are taken by value so they outlive the first
// suspension point of the caller.

auto RouteIndex::async_add(AddBatch batch) -> awaitable<Result<size_t>> {
    co_return add(batch);
}

auto RouteIndex::async_remove(std::string label) -> awaitable<Result<size_t>> {
    co_return remove(label);
}

auto RouteIndex::async_delete_all() -> awaitable<VoidResult> {
    co_return delete_all();
}

auto RouteIndex::async_delete_index() -> awaitable<VoidResult> {
    co_return delete_index();
}

auto RouteIndex::async_delete_records(LabelTexts records) -> awaitable<VoidResult> {
    co_return delete_records(records);
}

auto RouteIndex::async_describe() -> awaitable<IndexConfig> {
    co_return describe();
}

auto RouteIndex::async_is_ready() -> awaitable<bool> {
    co_return is_ready();
}

auto RouteIndex::async_query(std::vector<float> vector, size_t top_k,
                             std::vector<std::string> label_filter)
    -> awaitable<Result<QueryResult>> {
    co_return query(vector, top_k, label_filter);
}

auto RouteIndex::async_enumerate_all(std::optional<std::string> prefix,
                                     bool include_metadata)
    -> awaitable<Result<Corpus>> {
    co_return enumerate_all(std::move(prefix), include_metadata);
}

auto RouteIndex::async_read_config(std::string field,
                                   std::optional<std::string> scope)
    -> awaitable<Result<ConfigParameter>> {
    co_return read_config(field, std::move(scope));
}

auto RouteIndex::async_write_config(ConfigParameter config)
    -> awaitable<Result<ConfigParameter>> {
    co_return write_config(config);
}

} // namespace semroute::index
