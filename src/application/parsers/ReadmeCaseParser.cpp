/**
 * @file ReadmeCaseParser.cpp
 * @brief Implementation of ReadmeCaseParser.
 */

#include "application/parsers/ReadmeCaseParser.hpp"
#include "application/parsers/TextScan.hpp"
#include "infrastructure/TextFileReader.hpp"
#include <regex>
#include <sstream>

namespace simboard::application::parsers {

using domain::FieldMap;

namespace {

const std::regex kTimestamp(R"((\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}))");

std::optional<std::string> ExtractTimestamp(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        if (Trim(line).empty()) continue;
        std::smatch m;
        if (std::regex_search(line, m, kTimestamp, std::regex_constants::match_continuous)) {
            return m[1].str();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace

FieldMap ReadmeCaseParser::parse(const std::filesystem::path& path) const {
    return parseText(infrastructure::TextFileReader::ReadText(path));
}

FieldMap ReadmeCaseParser::parseText(const std::string& text) const {
    const auto lines = SplitLines(text);
    return {
        {"creation_date", ExtractTimestamp(lines)},
        {"grid_name", ExtractFlagValue(lines, "--res")},
        {"compset", ExtractFlagValue(lines, "--compset")},
    };
}

std::optional<std::string> ReadmeCaseParser::ExtractFlagValue(const std::vector<std::string>& lines,
                                                              const std::string& flag) {
    const std::string withEquals = flag + "=";
    for (const auto& line : lines) {
        if (line.find("create_newcase") == std::string::npos) continue;

        std::istringstream stream(line);
        std::vector<std::string> parts;
        std::string part;
        while (stream >> part) {
            parts.push_back(part);
        }

        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (parts[i] == flag) {
                if (i + 1 < parts.size()) {
                    return parts[i + 1];
                }
            } else if (parts[i].rfind(withEquals, 0) == 0) {
                return parts[i].substr(withEquals.size());
            }
        }
    }
    return std::nullopt;
}

} // namespace simboard::application::parsers
