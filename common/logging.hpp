#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace chromamap {
namespace logging {

// Environment variable read once when the logger is first used
constexpr const char* LOG_LEVEL_ENV = "CHROMAMAP_LOG_LEVEL";

// trace, debug, info, warn, error or off
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Shared stderr logger for the library and the CLI. Puzzle output goes
// to stdout, so diagnostics never mix with it.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("chromamap");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* level_env = std::getenv(LOG_LEVEL_ENV)) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown {} value '{}'", LOG_LEVEL_ENV, level_env);
            }
        }
        return log;
    }();
    return logger;
}

// Throws std::invalid_argument for an unknown level name
inline void set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    get_logger()->set_level(*level);
}

}  // namespace logging
}  // namespace chromamap
