/**
 * @file hijri_calendar.h
 * @brief Tabular (arithmetic) Islamic calendar
 *
 * Uses the civil epoch (1 Muharram 1 AH = Julian Day 1948440) and the
 * common 30-year leap cycle (years 2, 5, 7, 10, 13, 16, 18, 21, 24, 26, 29).
 * Observed month starts can differ from this by a day or two; the tabular
 * calendar is deterministic, which is what a stored record needs.
 *
 * @date 2026-10-18
 */

#pragma once

#include "nisab/utils/time_utils.h"
#include <string>
#include <optional>
#include <cstdint>

namespace nisab {
namespace utils {
namespace hijri {

struct HijriDate {
    int year = 1;
    int month = 1;   // 1 = Muharram ... 12 = Dhu al-Hijjah
    int day = 1;     // 1-30

    /** @brief "YYYY-MM-DD" (e.g., "1445-06-19") */
    std::string toString() const;

    bool operator==(const HijriDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const HijriDate& o) const { return !(*this == o); }
};

constexpr int64_t kIslamicEpochJdn = 1948440;
constexpr int64_t kUnixEpochJdn = 2440588;

bool isLeapYear(int year);

/** @brief 354 or 355 */
int yearLength(int year);

/** @brief 30 for odd months, 29 for even months, 30 for month 12 of a leap year */
int monthLength(int year, int month);

int64_t toJulianDay(const HijriDate& date);

HijriDate fromJulianDay(int64_t jdn);

HijriDate fromGregorian(const CivilDate& date);

/**
 * @brief Parse "YYYY-MM-DD" as a Hijri date
 */
std::optional<HijriDate> parse(const std::string& text);

} // namespace hijri
} // namespace utils
} // namespace nisab
