/**
 * @file BoatQuery.hpp
 * @brief Filter, partial-update and sort-key descriptors for registry queries.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Boat.hpp"
#include "domain/FleetErrors.hpp"
#include "domain/LaunchDate.hpp"
#include "domain/TextMatch.hpp"
#include "domain/VesselClass.hpp"

namespace fleetkeeper::domain {

/**
 * @struct BoatFilter
 * @brief Conjunctive, case-insensitive substring predicate.
 *
 * Unset fields do not constrain; an empty filter matches every boat.
 */
struct BoatFilter {
    std::optional<std::string> name;
    std::optional<std::string> homePort;
    std::optional<std::string> flag;

    bool isEmpty() const { return !name && !homePort && !flag; }

    bool matches(const Boat& boat) const {
        if (name && !ContainsIgnoreCase(boat.getName(), *name)) return false;
        if (homePort && !ContainsIgnoreCase(boat.getHomePort(), *homePort)) return false;
        if (flag && !ContainsIgnoreCase(boat.getFlag(), *flag)) return false;
        return true;
    }
};

/**
 * @struct BoatUpdate
 * @brief Partial update: only engaged fields are applied.
 */
struct BoatUpdate {
    std::optional<std::string> name;
    std::optional<std::string> homePort;
    std::optional<std::string> flag;
    std::optional<LaunchDate> launchDate;
    bool clearLaunchDate = false;   ///< Drops the launch date; wins over launchDate.
    std::optional<VesselProfile> profile;

    bool isEmpty() const {
        return !name && !homePort && !flag && !launchDate && !clearLaunchDate && !profile;
    }
};

/**
 * @enum SortKey
 * @brief Attribute a boat list can be ordered by.
 */
enum class SortKey {
    Name,
    HomePort,
    Flag,
    Id,
    LaunchDate
};

inline std::string SortKeyToString(SortKey key) {
    switch (key) {
        case SortKey::Name: return "name";
        case SortKey::HomePort: return "home_port";
        case SortKey::Flag: return "flag";
        case SortKey::Id: return "id";
        case SortKey::LaunchDate: return "launch_date";
        default: return "name";
    }
}

/**
 * @brief Parses a sort key name as used by collaborators ("name", "home_port", ...).
 * @throws InvalidInputError for unknown keys.
 */
inline SortKey ParseSortKey(const std::string& text) {
    std::string key = ToLowerAscii(text);
    if (key.empty() || key == "name") return SortKey::Name;
    if (key == "home_port") return SortKey::HomePort;
    if (key == "flag") return SortKey::Flag;
    if (key == "id") return SortKey::Id;
    if (key == "launch_date") return SortKey::LaunchDate;
    throw InvalidInputError("Unknown sort key: " + text);
}

} // namespace fleetkeeper::domain
