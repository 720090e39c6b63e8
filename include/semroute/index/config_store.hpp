#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "semroute/core/error.hpp"
#include "semroute/index/route_index.hpp"
#include "semroute/typesense/client.hpp"

namespace semroute::index {

/// Named string values stored as documents under the reserved config label,
/// one document per key with id "__config__" + key.
class ConfigStore {
public:
    explicit ConfigStore(typesense::Client& client);

    [[nodiscard]] static auto config_id(std::string_view field) -> std::string;

    /// A missing key (or missing collection) reads as an empty value.
    auto read(std::string_view field, std::optional<std::string> scope = std::nullopt)
        -> Result<ConfigParameter>;

    /// Upserts the value with a zero vector of the given width, as the
    /// collection's vector field is mandatory.
    auto write(const ConfigParameter& config, size_t dimensions) -> Result<ConfigParameter>;

private:
    typesense::Client& client_;
};

} // namespace semroute::index
