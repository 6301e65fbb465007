/**
 * @file TextScan.hpp
 * @brief Line splitting and anchored regex helpers shared by the metadata parsers.
 */

#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace simboard::application::parsers {

/** @brief Splits on "\n", "\r\n" and "\r"; line terminators are dropped. */
std::vector<std::string> SplitLines(const std::string& text);

/** @brief Strips leading and trailing whitespace. */
std::string Trim(const std::string& s);

/**
 * @brief Matches pattern at the start of the trimmed line.
 * @return The trimmed capture group, or std::nullopt when the line does not match.
 */
std::optional<std::string> MatchPrefix(const std::string& line, const std::regex& pattern, std::size_t group = 1);

/** @brief First line for which MatchPrefix succeeds. */
std::optional<std::string> FindFirst(const std::vector<std::string>& lines, const std::regex& pattern,
                                     std::size_t group = 1);

} // namespace simboard::application::parsers
