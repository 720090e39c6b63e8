#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "semroute/cli/commands.hpp"
#include "semroute/core/config.hpp"

namespace semroute::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration
/// (file, then environment overrides) and dispatches to the selected
/// subcommand.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
    CommandContext ctx_;
    std::string config_path_;
    std::string log_level_;
};

} // namespace semroute::cli
