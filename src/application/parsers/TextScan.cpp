/**
 * @file TextScan.cpp
 * @brief Implementation of the parser text helpers.
 */

#include "application/parsers/TextScan.hpp"

namespace simboard::application::parsers {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(current);
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string Trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::optional<std::string> MatchPrefix(const std::string& line, const std::regex& pattern, std::size_t group) {
    const std::string trimmed = Trim(line);
    std::smatch m;
    if (!std::regex_search(trimmed, m, pattern, std::regex_constants::match_continuous)) {
        return std::nullopt;
    }
    return Trim(m[group].str());
}

std::optional<std::string> FindFirst(const std::vector<std::string>& lines, const std::regex& pattern,
                                     std::size_t group) {
    for (const auto& line : lines) {
        if (auto value = MatchPrefix(line, pattern, group)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace simboard::application::parsers
