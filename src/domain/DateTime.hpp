/**
 * @file DateTime.hpp
 * @brief UTC timestamps, lenient parsing and calendar arithmetic for run metadata.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace simboard::domain {

/** @brief Second-resolution UTC instant. */
using UtcTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

/**
 * @struct CivilDate
 * @brief Proleptic Gregorian calendar date.
 */
struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

/**
 * @brief Parses the date formats found in E3SM metadata files.
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD[T ]HH:MM[:SS[.ffffff]]" with an optional "Z" or
 * "+HH:MM" offset, and the ctime-style "Tue Jan 10 12:34:56 2023". Values without an
 * offset are taken as UTC.
 * @return The instant, or std::nullopt when the text matches none of the formats.
 */
std::optional<UtcTime> ParseDateTime(const std::string& text);

/**
 * @brief Converts a ctime-style "%a %b %d %H:%M:%S %Y" string to "YYYY-MM-DDTHH:MM:SS".
 * @return std::nullopt when the text is not in that format.
 */
std::optional<std::string> ConvertCTimeToIso(const std::string& text);

/** @brief Formats as "YYYY-MM-DDTHH:MM:SS+00:00". */
std::string FormatIsoUtc(UtcTime time);

/** @brief Parses a strict "YYYY-MM-DD" date. */
std::optional<CivilDate> ParseCivilDate(const std::string& text);

/** @brief Formats as "YYYY-MM-DD". */
std::string FormatCivilDate(const CivilDate& date);

CivilDate AddDays(const CivilDate& date, long long days);

/** @brief Adds calendar months, clamping the day to the end of the target month. */
CivilDate AddMonths(const CivilDate& date, long long months);

/** @brief Adds calendar years, clamping Feb 29 to Feb 28 in non-leap years. */
CivilDate AddYears(const CivilDate& date, long long years);

} // namespace simboard::domain
