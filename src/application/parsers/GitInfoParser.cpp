/**
 * @file GitInfoParser.cpp
 * @brief Implementation of GitInfoParser.
 */

#include "application/parsers/GitInfoParser.hpp"
#include "application/parsers/TextScan.hpp"
#include "infrastructure/TextFileReader.hpp"
#include <regex>

namespace simboard::application::parsers {

using domain::FieldMap;

namespace {

// Version tag with optional pre-release segments, commit distance, abbreviated hash:
// v2.0.0-beta.3-3091-g3219b44fc, 3.0.2-55-gea457362f3
const std::regex kDescribe(R"(^(v?\d+(?:\.\d+)+(?:[-.][0-9A-Za-z]+)*)(?:-\d+)?-g([0-9a-f]+)$)");
const std::regex kLeadingToken(R"(^([^-]+))");
const std::regex kHashSuffix(R"(-g([0-9a-f]+)$)");

const std::regex kOnBranch(R"(On branch (.+))");
const std::regex kOriginHeader(R"(\[remote "origin"\])");
const std::regex kUrl(R"(url\s*=\s*(.+))");

} // namespace

FieldMap GitInfoParser::parseDescribe(const std::filesystem::path& path) const {
    return parseDescribeText(infrastructure::TextFileReader::ReadText(path));
}

FieldMap GitInfoParser::parseDescribeText(const std::string& text) const {
    FieldMap result{{"git_tag", std::nullopt}, {"git_commit_hash", std::nullopt}};

    for (const auto& rawLine : SplitLines(text)) {
        const std::string line = Trim(rawLine);
        if (line.empty()) continue;

        std::smatch m;
        if (std::regex_match(line, m, kDescribe)) {
            result["git_tag"] = m[1].str();
            result["git_commit_hash"] = m[2].str();
            continue;
        }

        if (std::regex_search(line, m, kLeadingToken)) {
            result["git_tag"] = m[1].str();
        }
        if (std::regex_search(line, m, kHashSuffix)) {
            result["git_commit_hash"] = m[1].str();
        }
    }
    return result;
}

std::optional<std::string> GitInfoParser::parseStatus(const std::filesystem::path& path) const {
    return parseStatusText(infrastructure::TextFileReader::ReadText(path));
}

std::optional<std::string> GitInfoParser::parseStatusText(const std::string& text) const {
    return FindFirst(SplitLines(text), kOnBranch);
}

std::optional<std::string> GitInfoParser::parseConfig(const std::filesystem::path& path) const {
    return parseConfigText(infrastructure::TextFileReader::ReadText(path));
}

std::optional<std::string> GitInfoParser::parseConfigText(const std::string& text) const {
    bool inOrigin = false;
    for (const auto& rawLine : SplitLines(text)) {
        const std::string line = Trim(rawLine);
        if (std::regex_search(line, kOriginHeader, std::regex_constants::match_continuous)) {
            inOrigin = true;
            continue;
        }
        if (!inOrigin) continue;

        if (auto url = MatchPrefix(line, kUrl)) {
            return url;
        }
        if (!line.empty() && line.front() == '[') {
            break;
        }
    }
    return std::nullopt;
}

} // namespace simboard::application::parsers
