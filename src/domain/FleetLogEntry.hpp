/**
 * @file FleetLogEntry.hpp
 * @brief Registry-wide journal line (joins, removals, arrivals).
 */

#pragma once

#include <string>
#include "domain/Clock.hpp"

namespace fleetkeeper::domain {

struct FleetLogEntry {
    Timestamp timestamp;
    std::string message;

    bool operator==(const FleetLogEntry& other) const {
        return timestamp == other.timestamp && message == other.message;
    }
};

} // namespace fleetkeeper::domain
