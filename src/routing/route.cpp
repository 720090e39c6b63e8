#include "semroute/routing/route.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/core/utils.hpp"
#include "semroute/index/document.hpp"

#include <algorithm>
#include <fstream>
#include <set>

namespace semroute::routing {

auto default_routes() -> std::vector<Route> {
    return {
        Route{
            .name = "politics",
            .utterances = {
                "isn't politics the best thing ever",
                "why don't you tell me about your political opinions",
                "don't you just love the president",
                "they're going to destroy this country!",
                "they will save the country!",
            },
        },
        Route{
            .name = "chitchat",
            .utterances = {
                "how's the weather today?",
                "how are things going?",
                "lovely weather today",
                "the weather is horrendous",
                "let's go to the chippy",
            },
        },
        Route{
            .name = "technical_support",
            .utterances = {
                "my application is crashing",
                "I'm getting an error message",
                "how do I reset my password",
                "the system is running slow",
                "I can't connect to the service",
                "help me troubleshoot this issue",
            },
        },
        Route{
            .name = "billing",
            .utterances = {
                "I have a question about my invoice",
                "how do I update my payment method",
                "can I get a refund",
                "what are your pricing plans",
                "I was charged incorrectly",
                "when is my next payment due",
            },
        },
        Route{
            .name = "product_info",
            .utterances = {
                "what features does your product have",
                "tell me about your enterprise plan",
                "do you have an API",
                "what integrations do you support",
                "is there a free tier available",
                "how does your product compare to competitors",
            },
        },
    };
}

auto load_routes(const std::filesystem::path& path) -> Result<std::vector<Route>> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(
            make_error(ErrorCode::InvalidConfig, "Cannot open routes file", path.string()));
    }

    std::vector<Route> routes;
    try {
        routes = json::parse(file).get<std::vector<Route>>();
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError, "Failed to parse routes file", e.what()));
    }

    std::set<std::string> names;
    for (const auto& route : routes) {
        // Labels are backquoted in filter expressions.
        if (route.name.empty() || route.name == index::kConfigLabel ||
            route.name.find('`') != std::string::npos) {
            return std::unexpected(
                make_error(ErrorCode::InvalidConfig, "Invalid route name", route.name));
        }
        if (!names.insert(route.name).second) {
            return std::unexpected(
                make_error(ErrorCode::InvalidConfig, "Duplicate route name", route.name));
        }
    }

    LOG_INFO("Loaded {} routes from {}", routes.size(), path.string());
    return routes;
}

auto routes_hash(const std::vector<Route>& routes) -> std::string {
    auto sorted = routes;
    std::ranges::sort(sorted, {}, &Route::name);
    for (auto& route : sorted) {
        std::ranges::sort(route.utterances);
    }
    // nlohmann::json orders object keys, so the dump is canonical.
    return utils::sha256(json(sorted).dump());
}

} // namespace semroute::routing
