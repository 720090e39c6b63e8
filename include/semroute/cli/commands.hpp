#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "semroute/core/config.hpp"

namespace semroute::cli {

/// Selection and arguments captured while parsing; dispatched once the
/// configuration has been loaded.
struct CommandContext {
    std::string selected;
    std::vector<std::string> query_words;
    std::string label;
};

/// `sync`: bring the remote index in line with the local routes.
void register_sync_command(CLI::App& app, CommandContext& ctx);

/// `route <query...>`: print the best route for a query as JSON.
void register_route_command(CLI::App& app, CommandContext& ctx);

/// `describe`: print index kind, dimensionality and document count.
void register_describe_command(CLI::App& app, CommandContext& ctx);

/// `ready`: exit 0 when the collection is reachable, 1 otherwise.
void register_ready_command(CLI::App& app, CommandContext& ctx);

/// `config`: print the effective configuration with secrets redacted.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// `delete-route <label>`: remove every record of one route.
void register_delete_route_command(CLI::App& app, CommandContext& ctx);

/// `drop`: delete the whole collection.
void register_drop_command(CLI::App& app, CommandContext& ctx);

/// Runs the selected command. @returns Process exit code.
auto dispatch(const CommandContext& ctx, const Config& config) -> int;

} // namespace semroute::cli
