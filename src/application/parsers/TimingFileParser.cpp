/**
 * @file TimingFileParser.cpp
 * @brief Implementation of TimingFileParser.
 */

#include "application/parsers/TimingFileParser.hpp"
#include "application/parsers/TextScan.hpp"
#include "domain/DateTime.hpp"
#include "domain/IngestionErrors.hpp"
#include "infrastructure/TextFileReader.hpp"
#include <algorithm>
#include <regex>

namespace simboard::application::parsers {

using domain::FieldMap;

namespace {

const std::regex kCase(R"(Case\s*[:=]\s*(.+))");
const std::regex kMachine(R"(Machine\s*[:=]\s*(.+))");
const std::regex kUser(R"(User\s*[:=]\s*(.+))");
const std::regex kLid(R"(LID\s*[:=]\s*(.+))");
const std::regex kCurrDate(R"(Curr Date\s*[:=]\s*(.+))");
const std::regex kGrid(R"(grid\s*[:=]\s*(.+))");
const std::regex kCompset(R"(compset\s*[:=]\s*(.+))");
const std::regex kRunType(R"(run type\s*[:=]\s*([^,]+))");
const std::regex kRunLength(R"(run length\s*[:=]\s*(.+))");
const std::regex kStopOption(R"(stop option\s*[:=]\s*([^,]+))");
const std::regex kStopNInline(R"(stop_n\s*[=:]\s*(\d+))");
const std::regex kStopNLine(R"(stop_n\s*[=:]\s*(.+))");
const std::regex kInstanceSuffix(R"(_\d+$)");

/// Keeps the raw text when it is not a ctime-style date.
std::optional<std::string> NormalizeStartDate(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return std::nullopt;
    if (auto iso = domain::ConvertCTimeToIso(*raw)) return iso;
    return raw;
}

std::pair<std::optional<std::string>, std::optional<std::string>>
ExtractStopOptionAndStopN(const std::vector<std::string>& lines) {
    std::optional<std::string> stopOption;
    std::optional<std::string> stopN;

    for (const auto& line : lines) {
        if (auto option = MatchPrefix(line, kStopOption)) {
            stopOption = option;
            std::smatch m;
            if (std::regex_search(line, m, kStopNInline)) {
                stopN = Trim(m[1].str());
            }
            break;
        }
    }

    if (!stopN) {
        stopN = FindFirst(lines, kStopNLine);
    }
    return {stopOption, stopN};
}

} // namespace

TimingFileParser::TimingFileParser(std::vector<std::string> knownExperimentTypes,
                                   std::shared_ptr<spdlog::logger> logger)
    : m_knownExperimentTypes(std::move(knownExperimentTypes)), m_logger(std::move(logger)) {}

FieldMap TimingFileParser::EmptyResult() {
    return {
        {"case_name", std::nullopt}, {"campaign", std::nullopt}, {"experiment_type", std::nullopt},
        {"machine", std::nullopt}, {"user", std::nullopt}, {"lid", std::nullopt},
        {"simulation_start_date", std::nullopt}, {"grid_resolution", std::nullopt},
        {"compset_alias", std::nullopt}, {"initialization_type", std::nullopt},
        {"stop_option", std::nullopt}, {"stop_n", std::nullopt}, {"run_length", std::nullopt},
    };
}

FieldMap TimingFileParser::parse(const std::filesystem::path& path) const {
    try {
        return parseText(infrastructure::TextFileReader::ReadText(path));
    } catch (const domain::FileReadError& e) {
        m_logger->warn("Failed to read timing file {}: {}", path.string(), e.what());
        return EmptyResult();
    }
}

FieldMap TimingFileParser::parseText(const std::string& text) const {
    const auto lines = SplitLines(text);
    FieldMap result = EmptyResult();

    result["case_name"] = FindFirst(lines, kCase);
    result["machine"] = FindFirst(lines, kMachine);
    result["user"] = FindFirst(lines, kUser);
    result["lid"] = FindFirst(lines, kLid);
    result["simulation_start_date"] = NormalizeStartDate(FindFirst(lines, kCurrDate));
    result["grid_resolution"] = FindFirst(lines, kGrid);
    result["compset_alias"] = FindFirst(lines, kCompset);
    result["initialization_type"] = FindFirst(lines, kRunType);
    result["run_length"] = FindFirst(lines, kRunLength);

    auto [campaign, experimentType] =
        ExtractCampaignAndExperimentType(result["case_name"], m_knownExperimentTypes);
    result["campaign"] = campaign;
    result["experiment_type"] = experimentType;

    auto [stopOption, stopN] = ExtractStopOptionAndStopN(lines);
    result["stop_option"] = stopOption;
    result["stop_n"] = stopN;

    if (!result["case_name"]) {
        m_logger->debug("Timing file has no Case line");
    }
    return result;
}

std::pair<std::optional<std::string>, std::optional<std::string>>
TimingFileParser::ExtractCampaignAndExperimentType(const std::optional<std::string>& caseName,
                                                   const std::vector<std::string>& knownExperimentTypes) {
    if (!caseName || caseName->empty()) {
        return {std::nullopt, std::nullopt};
    }

    // v3.LR.historical_0121 -> campaign v3.LR.historical, candidate "historical"
    std::string campaign = std::regex_replace(*caseName, kInstanceSuffix, "");
    auto lastDot = campaign.rfind('.');
    std::string candidate = lastDot == std::string::npos ? campaign : campaign.substr(lastDot + 1);

    std::optional<std::string> experimentType;
    if (std::find(knownExperimentTypes.begin(), knownExperimentTypes.end(), candidate) !=
        knownExperimentTypes.end()) {
        experimentType = candidate;
    }
    return {campaign, experimentType};
}

} // namespace simboard::application::parsers
