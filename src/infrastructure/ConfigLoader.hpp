/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading ingestion settings (settings.json).
 *
 * Keeps JSON parsing of the engine tunables in one place instead of
 * scattering it through the components that consume them.
 */

#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>
#include "domain/IngestionConfig.hpp"

namespace simboard::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file, overlaying the defaults.
     *
     * Recognized keys: "delta_fields", "known_experiment_types", "case_docs_prefix", "log_level".
     * A missing file yields the defaults silently; an unreadable or malformed one is logged
     * as an error and also yields the defaults.
     * @param path Absolute path to settings.json.
     * @param logger Logger for load diagnostics.
     */
    static domain::IngestionConfig Load(const std::filesystem::path& path, spdlog::logger& logger);

    /** @brief Writes the given settings to path, pretty-printed. Returns false on I/O failure. */
    static bool Save(const std::filesystem::path& path, const domain::IngestionConfig& config,
                     spdlog::logger& logger);
};

} // namespace simboard::infrastructure
