#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "semroute/core/config.hpp"
#include "semroute/core/error.hpp"

namespace semroute::routing {

using json = nlohmann::json;

/// A named intent and the example utterances that define it.
struct Route {
    std::string name;
    std::vector<std::string> utterances;
    std::optional<json> function_schema;
    json metadata = json::object();
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Route, name, utterances, function_schema, metadata)

/// Built-in catalog: politics, chitchat, technical_support, billing,
/// product_info.
auto default_routes() -> std::vector<Route>;

/// Reads a JSON array of routes. Empty names, the reserved config label,
/// names containing a backtick and duplicate names are rejected.
auto load_routes(const std::filesystem::path& path) -> Result<std::vector<Route>>;

/// SHA-256 of the canonical JSON of the routes, independent of route and
/// utterance order. Stored remotely to detect drift.
auto routes_hash(const std::vector<Route>& routes) -> std::string;

} // namespace semroute::routing
