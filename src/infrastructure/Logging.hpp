/**
 * @file Logging.hpp
 * @brief Factory for the named spdlog loggers injected into the engine components.
 */

#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace simboard::infrastructure {

class Logging {
public:
    /**
     * @brief Creates a logger writing to stderr with ISO timestamps.
     * @param name Logger name shown in each line.
     * @param level spdlog level name; unknown names fall back to "info".
     */
    static std::shared_ptr<spdlog::logger> CreateLogger(const std::string& name,
                                                        const std::string& level = "info");

    /** @brief Applies a level name to an existing logger. Returns false for unknown names. */
    static bool ApplyLevel(spdlog::logger& logger, const std::string& level);
};

} // namespace simboard::infrastructure
