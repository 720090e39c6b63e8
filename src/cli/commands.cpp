#include "semroute/cli/commands.hpp"
#include "semroute/core/logger.hpp"
#include "semroute/encoders/azure_openai.hpp"
#include "semroute/index/typesense_index.hpp"
#include "semroute/routing/router.hpp"

#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

namespace semroute::cli {

using json = nlohmann::json;

namespace {

void select(CLI::App* sub, CommandContext& ctx) {
    sub->callback([&ctx, name = sub->get_name()] { ctx.selected = name; });
}

auto report_error(std::string_view what, const Error& err) -> int {
    LOG_ERROR("{} failed [{}]: {}", what, error_code_to_string(err.code()), err.what());
    std::cerr << what << " failed: " << err.what() << "\n";
    return 1;
}

auto resolve_routes(const Config& config) -> Result<std::vector<routing::Route>> {
    if (config.routes_file) {
        return routing::load_routes(*config.routes_file);
    }
    return routing::default_routes();
}

auto make_router(const Config& config) -> Result<std::unique_ptr<routing::SemanticRouter>> {
    // Managed identity tokens come from the external identity subsystem,
    // which this binary does not embed.
    auto encoder = encoders::make_encoder(config.encoder);
    if (!encoder) return std::unexpected(encoder.error());

    auto routes = resolve_routes(config);
    if (!routes) return std::unexpected(routes.error());

    return std::make_unique<routing::SemanticRouter>(
        std::shared_ptr<encoders::EmbeddingProvider>(std::move(*encoder)),
        std::make_shared<index::TypesenseIndex>(config.typesense),
        std::move(*routes),
        routing::RouterOptions{.top_k = config.top_k,
                               .score_threshold = config.score_threshold});
}

auto run_sync(const Config& config) -> int {
    auto router = make_router(config);
    if (!router) return report_error("sync", router.error());

    auto report = (*router)->sync();
    if (!report) return report_error("sync", report.error());

    std::cout << json{
        {"skipped", report->skipped},
        {"added", report->added},
        {"updated", report->updated},
        {"removed", report->removed},
        {"unchanged", report->unchanged},
        {"vectors", (*router)->index().size()},
    }.dump(2) << "\n";
    return 0;
}

auto run_route(const Config& config, const std::vector<std::string>& words) -> int {
    std::string query;
    for (const auto& word : words) {
        if (!query.empty()) query += ' ';
        query += word;
    }

    auto router = make_router(config);
    if (!router) return report_error("route", router.error());

    auto choice = (*router)->route(query);
    if (!choice) return report_error("route", choice.error());

    std::cout << json{
        {"query", query},
        {"route", choice->name ? json(*choice->name) : json(nullptr)},
        {"similarity_score", choice->similarity_score ? json(*choice->similarity_score)
                                                      : json(nullptr)},
    }.dump(2) << "\n";
    return 0;
}

auto run_describe(const Config& config) -> int {
    index::TypesenseIndex index(config.typesense);
    auto info = index.describe();
    std::cout << json{
        {"type", info.type},
        {"collection", index.collection()},
        {"dimensions", info.dimensions},
        {"vectors", info.vectors},
    }.dump(2) << "\n";
    return 0;
}

auto run_ready(const Config& config) -> int {
    index::TypesenseIndex index(config.typesense);
    bool ready = index.is_ready();
    std::cout << (ready ? "ready" : "not ready") << "\n";
    return ready ? 0 : 1;
}

auto run_delete_route(const Config& config, const std::string& label) -> int {
    index::TypesenseIndex index(config.typesense);
    auto deleted = index.remove(label);
    if (!deleted) return report_error("delete-route", deleted.error());
    std::cout << "deleted " << *deleted << " records of route '" << label << "'\n";
    return 0;
}

auto run_drop(const Config& config) -> int {
    index::TypesenseIndex index(config.typesense);
    auto dropped = index.delete_index();
    if (!dropped) return report_error("drop", dropped.error());
    std::cout << "dropped collection '" << index.collection() << "'\n";
    return 0;
}

} // anonymous namespace

void register_sync_command(CLI::App& app, CommandContext& ctx) {
    select(app.add_subcommand("sync", "Sync the remote index with the local routes"), ctx);
}

void register_route_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("route", "Route a query to its nearest route");
    sub->add_option("query", ctx.query_words, "Text to classify")->required();
    select(sub, ctx);
}

void register_describe_command(CLI::App& app, CommandContext& ctx) {
    select(app.add_subcommand("describe", "Describe the remote index"), ctx);
}

void register_ready_command(CLI::App& app, CommandContext& ctx) {
    select(app.add_subcommand("ready", "Check that the remote index is reachable"), ctx);
}

void register_config_command(CLI::App& app, CommandContext& ctx) {
    select(app.add_subcommand("config", "Show the effective configuration"), ctx);
}

void register_delete_route_command(CLI::App& app, CommandContext& ctx) {
    auto* sub = app.add_subcommand("delete-route", "Delete every record of a route");
    sub->add_option("label", ctx.label, "Route name")->required();
    select(sub, ctx);
}

void register_drop_command(CLI::App& app, CommandContext& ctx) {
    select(app.add_subcommand("drop", "Delete the whole collection"), ctx);
}

auto dispatch(const CommandContext& ctx, const Config& config) -> int {
    if (ctx.selected == "sync") return run_sync(config);
    if (ctx.selected == "route") return run_route(config, ctx.query_words);
    if (ctx.selected == "describe") return run_describe(config);
    if (ctx.selected == "ready") return run_ready(config);
    if (ctx.selected == "delete-route") return run_delete_route(config, ctx.label);
    if (ctx.selected == "drop") return run_drop(config);
    if (ctx.selected == "config") {
        std::cout << redact(config).dump(2) << "\n";
        return 0;
    }
    std::cerr << "no command selected\n";
    return 2;
}

} // namespace semroute::cli
