/**
 * @file TimeFormat.hpp
 * @brief ISO-8601 text form of registry timestamps.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Clock.hpp"

namespace fleetkeeper::infrastructure {

class TimeFormat {
public:
    /**
     * @brief Formats as UTC "YYYY-MM-DDTHH:MM:SSZ", with ".mmm" before the Z
     * when the millisecond part is non-zero.
     */
    static std::string FormatIso8601(domain::Timestamp ts);

    /**
     * @brief Parses "YYYY-MM-DDTHH:MM:SS[.f...][Z|+HH:MM|-HH:MM]" or the legacy
     * "YYYY-MM-DD HH:MM:SS". Fractions are truncated to milliseconds and
     * offsets folded into UTC.
     * @return nullopt if the text is not one of the accepted shapes or names
     * an impossible date/time.
     */
    static std::optional<domain::Timestamp> ParseIso8601(const std::string& text);
};

} // namespace fleetkeeper::infrastructure
