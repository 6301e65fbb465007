/**
 * @file IngestionConfig.hpp
 * @brief Tunables of the ingestion engine.
 */

#pragma once
#include <string>
#include <vector>

namespace simboard::domain {

/**
 * @struct IngestionConfig
 * @brief Explicit configuration passed to the engine components at construction.
 */
struct IngestionConfig {
    /// Fields compared between a canonical run and later runs of the same case.
    std::vector<std::string> deltaFields = {
        "compset",
        "compset_alias",
        "grid_name",
        "grid_resolution",
        "initialization_type",
        "compiler",
        "git_tag",
        "git_commit_hash",
        "git_branch",
        "git_repository_url",
        "campaign",
        "experiment_type",
        "group_name",
    };

    /// Recognized experiment types (last dot segment of a campaign).
    std::vector<std::string> knownExperimentTypes = {
        // DECK
        "piControl", "historical", "amip", "abrupt-4xCO2", "1pctCO2",
        // ScenarioMIP
        "ssp119", "ssp126", "ssp245", "ssp370", "ssp585",
        // ESM variants
        "esm-hist", "esm-piControl",
    };

    /// Name prefix of the nested case documentation directory.
    std::string caseDocsPrefix = "CaseDocs";

    /// spdlog level name ("trace" .. "off").
    std::string logLevel = "info";
};

} // namespace simboard::domain
