/**
 * @file LaunchDate.hpp
 * @brief Value Object for a calendar date (YYYY-MM-DD).
 */

#pragma once

#include <cstdio>
#include <string>
#include "domain/FleetErrors.hpp"

namespace fleetkeeper::domain {

/**
 * @struct LaunchDate
 * @brief Validated proleptic Gregorian calendar date.
 */
struct LaunchDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    LaunchDate() = default;

    LaunchDate(int y, int m, int d) : year(y), month(m), day(d) {
        if (!IsValid(y, m, d)) {
            throw InvalidInputError("Invalid launch date: " + FormatParts(y, m, d));
        }
    }

    static bool IsLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
    }

    static int DaysInMonth(int y, int m) {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && IsLeapYear(y)) return 29;
        return kDays[m - 1];
    }

    static bool IsValid(int y, int m, int d) {
        if (y < 1 || y > 9999) return false;
        if (m < 1 || m > 12) return false;
        return d >= 1 && d <= DaysInMonth(y, m);
    }

    /**
     * @brief Parses strict "YYYY-MM-DD".
     * @throws InvalidInputError on any other shape or an impossible date.
     */
    static LaunchDate Parse(const std::string& text) {
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            throw InvalidInputError("Launch date must be formatted YYYY-MM-DD, got '" + text + "'");
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (text[i] < '0' || text[i] > '9') {
                throw InvalidInputError("Launch date must be formatted YYYY-MM-DD, got '" + text + "'");
            }
        }
        int y = std::stoi(text.substr(0, 4));
        int m = std::stoi(text.substr(5, 2));
        int d = std::stoi(text.substr(8, 2));
        return LaunchDate(y, m, d);
    }

    std::string toString() const { return FormatParts(year, month, day); }

    bool operator==(const LaunchDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const LaunchDate& other) const { return !(*this == other); }
    bool operator<(const LaunchDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

private:
    static std::string FormatParts(int y, int m, int d) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
        return buf;
    }
};

} // namespace fleetkeeper::domain
