/**
 * @file time_utils.h
 * @brief Civil (proleptic Gregorian) dates and ISO 8601 timestamps
 *
 * All conversions are UTC. Day arithmetic goes through a day count
 * relative to 1970-01-01 so it is exact for any year.
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace nisab {
namespace utils {

/**
 * @brief Calendar date without time of day
 */
struct CivilDate {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31

    /** @brief "YYYY-MM-DD" */
    std::string toString() const;

    bool operator==(const CivilDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const CivilDate& o) const { return !(*this == o); }
    bool operator<(const CivilDate& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator<=(const CivilDate& o) const { return !(o < *this); }
    bool operator>(const CivilDate& o) const { return o < *this; }
    bool operator>=(const CivilDate& o) const { return !(*this < o); }
};

/**
 * @brief Days since 1970-01-01 (negative before)
 */
int64_t daysFromCivil(const CivilDate& date);

CivilDate civilFromDays(int64_t days);

bool isValidCivilDate(int year, int month, int day);

/**
 * @brief Parse "YYYY-MM-DD"; a longer ISO 8601 timestamp is accepted and its date part used
 * @return std::nullopt on malformed or out-of-range input
 */
std::optional<CivilDate> parseDate(const std::string& text);

CivilDate addDays(const CivilDate& date, int days);

/**
 * @brief Signed number of days from start to end
 */
int daysBetween(const CivilDate& start, const CivilDate& end);

/**
 * @brief UTC calendar date of a time point
 */
CivilDate toCivilDate(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Format time_point as ISO 8601 ("2026-02-02T12:34:56Z" or with ".123")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Parse ISO 8601 (UTC "Z", numeric offsets, or PostgreSQL "YYYY-MM-DD HH:MM:SS[.ffffff][+00]")
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
);

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

} // namespace utils
} // namespace nisab
