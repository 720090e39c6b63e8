#include "semroute/cli/app.hpp"
#include "semroute/core/logger.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DSEMROUTE_VERSION_STRING=...
#ifndef SEMROUTE_VERSION_STRING
#define SEMROUTE_VERSION_STRING "0.1.0-dev"
#endif

namespace semroute::cli {

App::App()
    : cli_("semroute", "Semantic route index backed by Typesense")
{
    cli_.set_version_flag("--version", SEMROUTE_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("SEMROUTE_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(config_);
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::init("semroute", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }

    auto code = dispatch(ctx_, config_);
    Logger::flush();
    return code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_sync_command(cli_, ctx_);
    register_route_command(cli_, ctx_);
    register_describe_command(cli_, ctx_);
    register_ready_command(cli_, ctx_);
    register_config_command(cli_, ctx_);
    register_delete_route_command(cli_, ctx_);
    register_drop_command(cli_, ctx_);
}

} // namespace semroute::cli
