/**
 * @file Logging.cpp
 * @brief Implementation of Logging.
 */

#include "infrastructure/Logging.hpp"
#include <optional>
#include <utility>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace simboard::infrastructure {

namespace {

std::optional<spdlog::level::level_enum> LevelFromName(const std::string& name) {
    // spdlog::level::from_str maps unknown names to "off", which would silence everything.
    static const std::pair<const char*, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& [levelName, level] : kLevels) {
        if (name == levelName) return level;
    }
    return std::nullopt;
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::CreateLogger(const std::string& name, const std::string& level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%n] [%l] %v");
    if (!ApplyLevel(*logger, level)) {
        logger->set_level(spdlog::level::info);
        logger->warn("Unknown log level '{}', using info", level);
    }
    return logger;
}

bool Logging::ApplyLevel(spdlog::logger& logger, const std::string& level) {
    auto parsed = LevelFromName(level);
    if (!parsed) return false;
    logger.set_level(*parsed);
    return true;
}

} // namespace simboard::infrastructure
