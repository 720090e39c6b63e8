#pragma once

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

#include "semroute/core/error.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

/// Creates the route collection on demand.
///
/// The vector width is fixed when the collection is created and is never
/// reconciled afterwards; writes with a different width fail at the backend.
class SchemaManager {
public:
    explicit SchemaManager(typesense::Client& client);

    /// Collection schema with the route fields and a float[] vector field of
    /// the given width.
    [[nodiscard]] static auto collection_schema(std::string_view name, size_t dimensions)
        -> nlohmann::json;

    /// Side-effect-free existence check. NotFound is false; other failures
    /// propagate.
    auto exists() -> Result<bool>;

    /// Idempotent. Creates the collection if it is absent; losing a creation
    /// race to another initializer (AlreadyExists) counts as success.
    auto ensure_collection(size_t dimensions) -> VoidResult;

private:
    typesense::Client& client_;
};

} // namespace semroute::index
