#include "semroute/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace semroute {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    // Re-initialisation replaces the registered logger of the same name.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto& logger = get();
    if (level == "trace") logger->set_level(spdlog::level::trace);
    else if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
    else if (level == "critical") logger->set_level(spdlog::level::critical);
    else logger->set_level(spdlog::level::info);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace semroute
