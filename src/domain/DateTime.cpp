/**
 * @file DateTime.cpp
 * @brief Implementation of the date helpers.
 */

#include "domain/DateTime.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <regex>

namespace simboard::domain {

namespace {

constexpr std::array<const char*, 12> kMonthNames = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool IsLeapYear(long long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int DaysInMonth(long long year, int month) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[static_cast<size_t>(month - 1)];
}

// Days since 1970-01-01 (Howard Hinnant's days_from_civil).
long long DaysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilDate CivilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    CivilDate out;
    out.year = static_cast<int>(y + (m <= 2));
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

bool IsValidDate(int year, int month, int day) {
    return month >= 1 && month <= 12 && day >= 1 && day <= DaysInMonth(year, month);
}

bool IsValidTime(int hour, int minute, int second) {
    return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 && second >= 0 && second < 60;
}

UtcTime MakeUtc(int year, int month, int day, int hour, int minute, int second, long long offsetSeconds) {
    long long days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    long long secs = days * 86400 + hour * 3600LL + minute * 60LL + second - offsetSeconds;
    return UtcTime(std::chrono::seconds(secs));
}

int MonthFromName(const std::string& name) {
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        if (name == kMonthNames[i]) return static_cast<int>(i) + 1;
    }
    return 0;
}

struct CTimeFields {
    int year, month, day, hour, minute, second;
};

std::optional<CTimeFields> MatchCTime(const std::string& text) {
    static const std::regex kCTime(
        R"(^\s*[A-Z][a-z]{2} ([A-Z][a-z]{2}) +(\d{1,2}) (\d{2}):(\d{2}):(\d{2}) (\d{4})\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, kCTime)) return std::nullopt;

    CTimeFields f{};
    f.month = MonthFromName(m[1].str());
    f.day = std::stoi(m[2].str());
    f.hour = std::stoi(m[3].str());
    f.minute = std::stoi(m[4].str());
    f.second = std::stoi(m[5].str());
    f.year = std::stoi(m[6].str());
    if (f.month == 0 || !IsValidDate(f.year, f.month, f.day) || !IsValidTime(f.hour, f.minute, f.second)) {
        return std::nullopt;
    }
    return f;
}

} // namespace

std::optional<UtcTime> ParseDateTime(const std::string& text) {
    static const std::regex kIso(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?)?\s*(Z|[+-]\d{2}:?\d{2})?\s*$)");

    std::smatch m;
    if (std::regex_match(text, m, kIso)) {
        int year = std::stoi(m[1].str());
        int month = std::stoi(m[2].str());
        int day = std::stoi(m[3].str());
        int hour = m[4].matched ? std::stoi(m[4].str()) : 0;
        int minute = m[5].matched ? std::stoi(m[5].str()) : 0;
        int second = m[6].matched ? std::stoi(m[6].str()) : 0;
        if (!IsValidDate(year, month, day) || !IsValidTime(hour, minute, second)) {
            return std::nullopt;
        }

        long long offset = 0;
        if (m[7].matched && m[7].str() != "Z") {
            std::string tz = m[7].str();
            int sign = tz[0] == '-' ? -1 : 1;
            std::string digits;
            for (char c : tz.substr(1)) {
                if (c != ':') digits.push_back(c);
            }
            int oh = std::stoi(digits.substr(0, 2));
            int om = std::stoi(digits.substr(2, 2));
            if (oh > 23 || om > 59) return std::nullopt;
            offset = sign * (oh * 3600LL + om * 60LL);
        }
        return MakeUtc(year, month, day, hour, minute, second, offset);
    }

    if (auto f = MatchCTime(text)) {
        return MakeUtc(f->year, f->month, f->day, f->hour, f->minute, f->second, 0);
    }
    return std::nullopt;
}

std::optional<std::string> ConvertCTimeToIso(const std::string& text) {
    auto f = MatchCTime(text);
    if (!f) return std::nullopt;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d",
                  f->year, f->month, f->day, f->hour, f->minute, f->second);
    return std::string(buffer);
}

std::string FormatIsoUtc(UtcTime time) {
    long long secs = time.time_since_epoch().count();
    long long days = secs / 86400;
    long long rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    CivilDate date = CivilFromDays(days);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02lld:%02lld:%02lld+00:00",
                  date.year, date.month, date.day, rem / 3600, (rem % 3600) / 60, rem % 60);
    return std::string(buffer);
}

std::optional<CivilDate> ParseCivilDate(const std::string& text) {
    static const std::regex kDate(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    std::smatch m;
    if (!std::regex_match(text, m, kDate)) return std::nullopt;
    CivilDate date{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
    if (!IsValidDate(date.year, date.month, date.day)) return std::nullopt;
    return date;
}

std::string FormatCivilDate(const CivilDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
    return std::string(buffer);
}

CivilDate AddDays(const CivilDate& date, long long days) {
    long long base = DaysFromCivil(date.year, static_cast<unsigned>(date.month), static_cast<unsigned>(date.day));
    return CivilFromDays(base + days);
}

CivilDate AddMonths(const CivilDate& date, long long months) {
    long long total = static_cast<long long>(date.year) * 12 + (date.month - 1) + months;
    long long year = total >= 0 ? total / 12 : (total - 11) / 12;
    int month = static_cast<int>(total - year * 12) + 1;
    CivilDate out;
    out.year = static_cast<int>(year);
    out.month = month;
    out.day = std::min(date.day, DaysInMonth(year, month));
    return out;
}

CivilDate AddYears(const CivilDate& date, long long years) {
    CivilDate out;
    out.year = static_cast<int>(date.year + years);
    out.month = date.month;
    out.day = std::min(date.day, DaysInMonth(out.year, out.month));
    return out;
}

} // namespace simboard::domain
