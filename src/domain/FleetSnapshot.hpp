/**
 * @file FleetSnapshot.hpp
 * @brief Complete persistable state of a registry.
 */

#pragma once

#include <optional>
#include <vector>

#include "domain/Boat.hpp"
#include "domain/Clock.hpp"
#include "domain/FleetLogEntry.hpp"

namespace fleetkeeper::domain {

/**
 * @struct FleetSnapshot
 * @brief Boats in insertion order plus the fleet journal.
 */
struct FleetSnapshot {
    std::vector<Boat> boats;
    std::vector<FleetLogEntry> fleetLog;
    std::optional<Timestamp> savedAt;   ///< Written on save, informational on load.
};

} // namespace fleetkeeper::domain
