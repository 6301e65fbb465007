/**
 * @file CaseStatusParser.hpp
 * @brief Derives simulation dates and the latest run outcome from CaseStatus logs.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "domain/SimulationMetadata.hpp"

namespace simboard::application::parsers {

/**
 * @class CaseStatusParser
 * @brief Reads RUN_STARTDATE, STOP_OPTION/STOP_N and the case.run markers.
 *
 * Output keys: simulation_start_date, simulation_end_date, run_start_date,
 * run_end_date and status. The status reflects the latest "case.run starting"
 * marker: completed or failed after its first terminal marker, running when
 * none follows it, and null when no run was ever started.
 */
class CaseStatusParser {
public:
    explicit CaseStatusParser(std::shared_ptr<spdlog::logger> logger);

    /** @brief Parses a plain or gzipped file. An unreadable file yields all-null fields. */
    domain::FieldMap parse(const std::filesystem::path& path) const;

    /**
     * @param text File content.
     * @param source Name used in warnings about malformed lines.
     */
    domain::FieldMap parseText(const std::string& text, const std::string& source = "<text>") const;

    /**
     * @brief start + n units, where the unit is taken from an option containing
     * "days", "months" or "years".
     * @return "YYYY-MM-DD", or std::nullopt for other units, n == 0, an invalid start,
     * or an end past year 9999.
     */
    static std::optional<std::string> CalculateEndDate(const std::optional<std::string>& startDate,
                                                       const std::string& stopOption, long long stopN);

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace simboard::application::parsers
