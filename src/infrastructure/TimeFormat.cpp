/**
 * @file TimeFormat.cpp
 * @brief Implementation of TimeFormat.
 */

#include "infrastructure/TimeFormat.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include "domain/LaunchDate.hpp"

namespace fleetkeeper::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool IsDigit(char c) { return c >= '0' && c <= '9'; }

bool ReadFixed(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!IsDigit(s[i])) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

std::string TimeFormat::FormatIso8601(domain::Timestamp ts) {
    using namespace std::chrono;
    const std::int64_t totalMs = duration_cast<milliseconds>(ts.time_since_epoch()).count();
    std::int64_t secs = totalMs / 1000;
    std::int64_t ms = totalMs % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::tm tm = ToUtcTime(static_cast<std::time_t>(secs));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    std::string out(buf);
    if (ms != 0) {
        char frac[8];
        std::snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(ms));
        out += frac;
    }
    out += "Z";
    return out;
}

std::optional<domain::Timestamp> TimeFormat::ParseIso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    // Fixed prefix: YYYY-MM-DD?HH:MM:SS
    if (text.size() < 19) return std::nullopt;
    if (!ReadFixed(text, 0, 4, year) || text[4] != '-' ||
        !ReadFixed(text, 5, 2, month) || text[7] != '-' ||
        !ReadFixed(text, 8, 2, day)) {
        return std::nullopt;
    }
    const char sep = text[10];
    if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
    if (!ReadFixed(text, 11, 2, hour) || text[13] != ':' ||
        !ReadFixed(text, 14, 2, minute) || text[16] != ':' ||
        !ReadFixed(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (!domain::LaunchDate::IsValid(year, month, day)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    size_t pos = 19;
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && IsDigit(text[pos])) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) return std::nullopt;
        for (size_t i = digits; i < 3; ++i) millis *= 10;
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        const char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int offH = 0, offM = 0;
            if (!ReadFixed(text, pos + 1, 2, offH) || pos + 3 >= text.size() ||
                text[pos + 3] != ':' || !ReadFixed(text, pos + 4, 2, offM)) {
                return std::nullopt;
            }
            if (offH > 23 || offM > 59) return std::nullopt;
            offsetSeconds = (offH * 3600 + offM * 60) * (zone == '-' ? -1 : 1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    const std::int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;

    using namespace std::chrono;
    // Valid calendar dates can still lie outside what Timestamp represents
    // (about 1677-2262 with nanosecond ticks).
    const std::int64_t limit = duration_cast<seconds>(domain::Timestamp::duration::max()).count() - 1;
    if (secs > limit || secs < -limit) return std::nullopt;

    return domain::Timestamp(duration_cast<domain::Timestamp::duration>(
        seconds(secs) + milliseconds(millis)));
}

} // namespace fleetkeeper::infrastructure
