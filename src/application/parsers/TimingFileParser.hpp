/**
 * @file TimingFileParser.hpp
 * @brief Extracts case, machine and run configuration from e3sm_timing files.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "domain/SimulationMetadata.hpp"

namespace simboard::application::parsers {

/**
 * @class TimingFileParser
 * @brief Line-oriented "key: value" reader for the E3SM timing summary.
 *
 * Produces case_name, campaign, experiment_type, machine, user, lid,
 * simulation_start_date, grid_resolution, compset_alias, initialization_type,
 * stop_option, stop_n and run_length. Missing keys are std::nullopt.
 */
class TimingFileParser {
public:
    TimingFileParser(std::vector<std::string> knownExperimentTypes, std::shared_ptr<spdlog::logger> logger);

    /** @brief Parses a plain or gzipped file. An unreadable file yields all-null fields. */
    domain::FieldMap parse(const std::filesystem::path& path) const;

    domain::FieldMap parseText(const std::string& text) const;

    /**
     * @brief Derives the campaign (case name without a trailing "_<digits>") and the
     * experiment type (last dot segment, when it is a known type).
     */
    static std::pair<std::optional<std::string>, std::optional<std::string>>
    ExtractCampaignAndExperimentType(const std::optional<std::string>& caseName,
                                     const std::vector<std::string>& knownExperimentTypes);

private:
    static domain::FieldMap EmptyResult();

    std::vector<std::string> m_knownExperimentTypes;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application::parsers
