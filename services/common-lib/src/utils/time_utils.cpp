/**
 * @file time_utils.cpp
 * @brief Civil date arithmetic and ISO 8601 formatting/parsing
 */

#include "nisab/utils/time_utils.h"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace nisab {
namespace utils {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool readDigits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

std::string CivilDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

// Howard Hinnant's days_from_civil / civil_from_days
int64_t daysFromCivil(const CivilDate& date) {
    int64_t y = date.year - (date.month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (date.month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + date.day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    CivilDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

bool isValidCivilDate(int year, int month, int day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

std::optional<CivilDate> parseDate(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }

    CivilDate date;
    if (!readDigits(text, 0, 4, date.year) ||
        !readDigits(text, 5, 2, date.month) ||
        !readDigits(text, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (!isValidCivilDate(date.year, date.month, date.day)) {
        return std::nullopt;
    }
    return date;
}

CivilDate addDays(const CivilDate& date, int days) {
    return civilFromDays(daysFromCivil(date) + days);
}

int daysBetween(const CivilDate& start, const CivilDate& end) {
    return static_cast<int>(daysFromCivil(end) - daysFromCivil(start));
}

CivilDate toCivilDate(const std::chrono::system_clock::time_point& tp) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) {
        --days;
    }
    return civilFromDays(days);
}

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    int64_t secs = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        --secs;
    }
    int64_t days = secs / 86400;
    int64_t secOfDay = secs % 86400;
    if (secOfDay < 0) {
        secOfDay += 86400;
        --days;
    }

    CivilDate date = civilFromDays(days);
    std::ostringstream oss;
    oss << date.toString() << 'T' << std::setfill('0')
        << std::setw(2) << secOfDay / 3600 << ':'
        << std::setw(2) << (secOfDay % 3600) / 60 << ':'
        << std::setw(2) << secOfDay % 60;
    if (includeMilliseconds) {
        oss << '.' << std::setw(3) << millis;
    }
    oss << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& iso8601) {
    auto date = parseDate(iso8601);
    if (!date) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0;
    int64_t micros = 0;
    int offsetSeconds = 0;

    if (iso8601.size() > 10) {
        if (!readDigits(iso8601, 11, 2, hour) || iso8601.size() < 19 || iso8601[13] != ':' ||
            !readDigits(iso8601, 14, 2, minute) || iso8601[16] != ':' ||
            !readDigits(iso8601, 17, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        size_t pos = 19;
        if (pos < iso8601.size() && iso8601[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < iso8601.size() && std::isdigit(static_cast<unsigned char>(iso8601[pos]))) {
                if (digits < 6) {
                    micros = micros * 10 + (iso8601[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (; digits < 6; ++digits) micros *= 10;
        }

        if (pos < iso8601.size()) {
            char sign = iso8601[pos];
            if (sign == 'Z' || sign == 'z') {
                ++pos;
            } else if (sign == '+' || sign == '-') {
                int oh = 0, om = 0;
                if (!readDigits(iso8601, pos + 1, 2, oh)) return std::nullopt;
                pos += 3;
                if (pos < iso8601.size() && iso8601[pos] == ':') ++pos;
                if (pos < iso8601.size()) {
                    if (!readDigits(iso8601, pos, 2, om)) return std::nullopt;
                    pos += 2;
                }
                offsetSeconds = (oh * 3600 + om * 60) * (sign == '-' ? -1 : 1);
            }
            if (pos != iso8601.size()) {
                return std::nullopt;
            }
        }
    }

    int64_t secs = daysFromCivil(*date) * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(secs * 1000000 + micros)));
}

} // namespace utils
} // namespace nisab
