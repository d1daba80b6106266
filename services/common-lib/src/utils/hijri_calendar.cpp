/**
 * @file hijri_calendar.cpp
 * @brief Tabular Islamic calendar conversions via Julian Day Numbers
 */

#include "nisab/utils/hijri_calendar.h"
#include <algorithm>
#include <cstdio>

namespace nisab {
namespace utils {
namespace hijri {

namespace {

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Days before the first day of month m: ceil(29.5 * (m - 1))
int64_t daysBeforeMonth(int month) {
    return (59 * (month - 1) + 1) / 2;
}

} // anonymous namespace

std::string HijriDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool isLeapYear(int year) {
    int64_t n = 14 + 11 * static_cast<int64_t>(year);
    return n - floorDiv(n, 30) * 30 < 11;
}

int yearLength(int year) {
    return isLeapYear(year) ? 355 : 354;
}

int monthLength(int year, int month) {
    if (month == 12 && isLeapYear(year)) {
        return 30;
    }
    return (month % 2 == 1) ? 30 : 29;
}

int64_t toJulianDay(const HijriDate& date) {
    return date.day
        + daysBeforeMonth(date.month)
        + (static_cast<int64_t>(date.year) - 1) * 354
        + floorDiv(3 + 11 * static_cast<int64_t>(date.year), 30)
        + kIslamicEpochJdn - 1;
}

HijriDate fromJulianDay(int64_t jdn) {
    HijriDate result;
    result.year = static_cast<int>(floorDiv(30 * (jdn - kIslamicEpochJdn) + 10646, 10631));

    int month = 1;
    while (month < 12 && jdn >= toJulianDay(HijriDate{result.year, month + 1, 1})) {
        ++month;
    }
    result.month = month;
    result.day = static_cast<int>(jdn - toJulianDay(HijriDate{result.year, month, 1}) + 1);
    return result;
}

HijriDate fromGregorian(const CivilDate& date) {
    return fromJulianDay(daysFromCivil(date) + kUnixEpochJdn);
}

std::optional<HijriDate> parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (y < 1 || m < 1 || m > 12 || d < 1 || d > monthLength(y, m)) {
        return std::nullopt;
    }
    return HijriDate{y, m, d};
}

} // namespace hijri
} // namespace utils
} // namespace nisab
