/**
 * @file CaseStatusParser.cpp
 * @brief Implementation of CaseStatusParser.
 */

#include "application/parsers/CaseStatusParser.hpp"
#include "application/parsers/TextScan.hpp"
#include "domain/DateTime.hpp"
#include "domain/IngestionErrors.hpp"
#include "domain/SimulationEnums.hpp"
#include "infrastructure/TextFileReader.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace simboard::application::parsers {

using domain::FieldMap;

namespace {

const std::regex kRunStartDate(R"(RUN_STARTDATE=(\d{4}-\d{2}-\d{2}))");
const std::regex kStopOptionStopN(R"(STOP_OPTION=([^,\s]+),STOP_N=(\d+))");
const std::regex kCaseRunStart(
    R"(^(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}):\s+case\.run\s+starting(?:\s+(\S+))?\s*$)");
const std::regex kCaseRunTerminal(
    R"(^(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}):\s+case\.run\s+(success|error)\b)");

// Largest year a "YYYY-MM-DD" end date can carry.
constexpr long long kMaxYear = 9999;

FieldMap EmptyResult() {
    return {
        {"simulation_start_date", std::nullopt},
        {"simulation_end_date", std::nullopt},
        {"run_start_date", std::nullopt},
        {"run_end_date", std::nullopt},
        {"status", std::nullopt},
    };
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

CaseStatusParser::CaseStatusParser(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

FieldMap CaseStatusParser::parse(const std::filesystem::path& path) const {
    try {
        return parseText(infrastructure::TextFileReader::ReadText(path), path.string());
    } catch (const domain::FileReadError& e) {
        m_logger->warn("Failed to read case status file {} ({})", path.string(), e.what());
        return EmptyResult();
    }
}

FieldMap CaseStatusParser::parseText(const std::string& text, const std::string& source) const {
    FieldMap result = EmptyResult();
    const auto lines = SplitLines(text);

    std::optional<std::size_t> latestStart;
    std::string latestStartTimestamp;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        std::smatch m;

        if (std::regex_search(line, m, kRunStartDate)) {
            result["simulation_start_date"] = m[1].str();
        } else if (Contains(line, "RUN_STARTDATE")) {
            m_logger->warn("Malformed RUN_STARTDATE line in {}: {}", source, Trim(line));
        }

        if (std::regex_search(line, m, kStopOptionStopN)) {
            // End date uses the start date known at this point of the log.
            long long stopN = 0;
            try {
                stopN = std::stoll(m[2].str());
            } catch (const std::out_of_range& e) {
                m_logger->warn("Malformed STOP_OPTION/STOP_N line in {}: {} ({})", source, Trim(line), e.what());
                continue;
            }
            result["simulation_end_date"] =
                CalculateEndDate(result["simulation_start_date"], m[1].str(), stopN);
            if (!result["simulation_end_date"] && result["simulation_start_date"] && stopN > 0) {
                m_logger->warn("Cannot derive an end date from {} in {}", Trim(line), source);
            }
        } else if (Contains(line, "STOP_OPTION") && Contains(line, "STOP_N")) {
            m_logger->warn("Malformed STOP_OPTION/STOP_N line in {}: {}", source, Trim(line));
        }

        const std::string trimmed = Trim(line);
        if (std::regex_search(trimmed, m, kCaseRunStart)) {
            latestStart = i;
            latestStartTimestamp = m[1].str();
        }
    }

    if (!latestStart) {
        return result;
    }

    result["run_start_date"] = latestStartTimestamp;
    for (std::size_t i = *latestStart + 1; i < lines.size(); ++i) {
        const std::string trimmed = Trim(lines[i]);
        std::smatch m;
        if (!std::regex_search(trimmed, m, kCaseRunTerminal)) {
            continue;
        }
        result["run_end_date"] = m[1].str();
        result["status"] = domain::ToString(m[2].str() == "success" ? domain::SimulationStatus::Completed
                                                                     : domain::SimulationStatus::Failed);
        return result;
    }

    result["status"] = domain::ToString(domain::SimulationStatus::Running);
    return result;
}

std::optional<std::string> CaseStatusParser::CalculateEndDate(const std::optional<std::string>& startDate,
                                                             const std::string& stopOption, long long stopN) {
    if (!startDate || startDate->empty() || stopOption.empty() || stopN == 0) {
        return std::nullopt;
    }
    auto start = domain::ParseCivilDate(*startDate);
    if (!start) {
        return std::nullopt;
    }

    std::string option = stopOption;
    std::transform(option.begin(), option.end(), option.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    const long long yearsLeft = kMaxYear - start->year;
    if (Contains(option, "days")) {
        // Coarse bound first so the day arithmetic cannot overflow.
        if (stopN > (yearsLeft + 1) * 366) {
            return std::nullopt;
        }
        domain::CivilDate end = domain::AddDays(*start, stopN);
        if (end.year > kMaxYear) {
            return std::nullopt;
        }
        return domain::FormatCivilDate(end);
    }
    if (Contains(option, "months")) {
        if (stopN > yearsLeft * 12 + (12 - start->month)) {
            return std::nullopt;
        }
        return domain::FormatCivilDate(domain::AddMonths(*start, stopN));
    }
    if (Contains(option, "years")) {
        if (stopN > yearsLeft) {
            return std::nullopt;
        }
        return domain::FormatCivilDate(domain::AddYears(*start, stopN));
    }
    return std::nullopt;
}

} // namespace simboard::application::parsers
