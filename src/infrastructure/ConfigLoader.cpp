/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace simboard::infrastructure {

namespace fs = std::filesystem;

domain::IngestionConfig ConfigLoader::Load(const fs::path& path, spdlog::logger& logger) {
    domain::IngestionConfig config;
    if (!fs::exists(path)) {
        logger.debug("No settings file at {}, using defaults", path.string());
        return config;
    }

    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            logger.error("Cannot open settings file {}", path.string());
            return config;
        }
        nlohmann::json j;
        f >> j;

        domain::IngestionConfig loaded = config;
        if (j.contains("delta_fields")) {
            loaded.deltaFields = j["delta_fields"].get<std::vector<std::string>>();
        }
        if (j.contains("known_experiment_types")) {
            loaded.knownExperimentTypes = j["known_experiment_types"].get<std::vector<std::string>>();
        }
        if (j.contains("case_docs_prefix")) {
            loaded.caseDocsPrefix = j["case_docs_prefix"].get<std::string>();
        }
        if (j.contains("log_level")) {
            loaded.logLevel = j["log_level"].get<std::string>();
        }
        config = std::move(loaded);
        logger.info("Loaded settings from {}", path.string());
    } catch (const std::exception& e) {
        logger.error("Error reading {}: {}. Using defaults.", path.string(), e.what());
    }

    return config;
}

bool ConfigLoader::Save(const fs::path& path, const domain::IngestionConfig& config, spdlog::logger& logger) {
    nlohmann::json j;
    j["delta_fields"] = config.deltaFields;
    j["known_experiment_types"] = config.knownExperimentTypes;
    j["case_docs_prefix"] = config.caseDocsPrefix;
    j["log_level"] = config.logLevel;

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream f(path);
        f << j.dump(4);
        if (!f) {
            logger.error("Error writing {}", path.string());
            return false;
        }
    } catch (const std::exception& e) {
        logger.error("Error writing {}: {}", path.string(), e.what());
        return false;
    }
    return true;
}

} // namespace simboard::infrastructure
