/**
 * @file FleetRegistry.cpp
 * @brief Implementation of FleetRegistry.
 */

#include "application/FleetRegistry.hpp"
#include <algorithm>
#include <iostream>
#include "domain/FleetErrors.hpp"
#include "domain/TextMatch.hpp"

namespace fleetkeeper::application {

using namespace fleetkeeper::domain;

FleetRegistry::FleetRegistry(std::shared_ptr<IFleetStore> store,
                             std::shared_ptr<const Clock> clock)
    : m_store(std::move(store)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = std::make_shared<SystemClock>();
    }
}

Boat FleetRegistry::addBoat(const std::string& id,
                            const std::string& name,
                            const std::string& homePort,
                            const std::string& flag,
                            const std::optional<LaunchDate>& launchDate,
                            const VesselProfile& profile) {
    // Construction validates id/name before the duplicate check.
    Boat boat(id, name, homePort, flag);
    boat.setLaunchDate(launchDate);
    boat.setProfile(profile);

    if (m_index.count(id) != 0) {
        throw DuplicateIdError(id);
    }

    m_boats.push_back(boat);
    m_index.emplace(id, m_boats.size() - 1);
    appendLog(name + " joined the fleet.");

    if (m_verbose) {
        std::cout << "[FleetRegistry] Added boat " << id << " (" << name << ")" << std::endl;
    }
    return boat;
}

Boat FleetRegistry::updateBoat(const std::string& id, const BoatUpdate& update) {
    Boat& target = requireBoat(id);

    // Apply to a copy so a rejected field leaves the boat untouched.
    Boat updated = target;
    if (update.name) updated.setName(*update.name);
    if (update.homePort) updated.setHomePort(*update.homePort);
    if (update.flag) updated.setFlag(*update.flag);
    if (update.clearLaunchDate) {
        updated.setLaunchDate(std::nullopt);
    } else if (update.launchDate) {
        updated.setLaunchDate(update.launchDate);
    }
    if (update.profile) updated.setProfile(*update.profile);

    target = updated;
    if (!update.isEmpty()) {
        appendLog(target.getName() + " details updated.");
    }
    return target;
}

void FleetRegistry::removeBoat(const std::string& id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        throw NotFoundError(id);
    }

    const std::string name = m_boats[it->second].getName();
    m_boats.erase(m_boats.begin() + static_cast<std::ptrdiff_t>(it->second));
    m_index = BuildIndex(m_boats);
    appendLog(name + " was removed from the fleet.");

    if (m_verbose) {
        std::cout << "[FleetRegistry] Removed boat " << id << std::endl;
    }
}

PositionRecord FleetRegistry::recordPosition(const std::string& id,
                                             double latitude,
                                             double longitude,
                                             const std::optional<Timestamp>& timestamp) {
    Boat& boat = requireBoat(id);
    PositionRecord record(latitude, longitude, resolveTimestamp(timestamp));
    boat.appendPosition(record);
    return record;
}

ArrivalLogEntry FleetRegistry::recordArrival(const std::string& id,
                                             const std::string& port,
                                             const std::optional<Timestamp>& timestamp,
                                             const std::string& note) {
    Boat& boat = requireBoat(id);
    ArrivalLogEntry entry(port, resolveTimestamp(timestamp), note);
    boat.appendArrival(entry);
    appendLog(boat.getName() + " arrived at " + port + ".");
    return entry;
}

std::vector<Boat> FleetRegistry::listBoats() const {
    return m_boats;
}

std::vector<Boat> FleetRegistry::filterBoats(const BoatFilter& filter) const {
    if (filter.isEmpty()) {
        return listBoats();
    }
    std::vector<Boat> matches;
    for (const auto& boat : m_boats) {
        if (filter.matches(boat)) {
            matches.push_back(boat);
        }
    }
    return matches;
}

std::vector<Boat> FleetRegistry::sortBoats(std::vector<Boat> boats, SortKey key) {
    auto textKey = [key](const Boat& b) -> const std::string& {
        switch (key) {
            case SortKey::HomePort: return b.getHomePort();
            case SortKey::Flag: return b.getFlag();
            case SortKey::Id: return b.getId();
            case SortKey::Name:
            default: return b.getName();
        }
    };

    if (key == SortKey::LaunchDate) {
        std::stable_sort(boats.begin(), boats.end(), [](const Boat& a, const Boat& b) {
            const auto& da = a.getLaunchDate();
            const auto& db = b.getLaunchDate();
            if (!db) return false;
            if (!da) return true;
            return *da < *db;
        });
    } else {
        std::stable_sort(boats.begin(), boats.end(), [&textKey](const Boat& a, const Boat& b) {
            return LessIgnoreCase(textKey(a), textKey(b));
        });
    }
    return boats;
}

std::optional<Boat> FleetRegistry::findBoat(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) return std::nullopt;
    return m_boats[it->second];
}

std::vector<PositionRecord> FleetRegistry::positionHistory(const std::string& id) const {
    return requireBoat(id).getPositions();
}

FleetStatusReport FleetRegistry::statusReport() const {
    return BuildStatusReport(m_boats);
}

void FleetRegistry::save(const std::string& path) const {
    FleetSnapshot snapshot;
    snapshot.boats = m_boats;
    snapshot.fleetLog = m_fleetLog;
    snapshot.savedAt = TruncateToMillis(m_clock->now());

    m_store->save(path, snapshot);

    if (m_verbose) {
        std::cout << "[FleetRegistry] Saved " << m_boats.size() << " boats to " << path << std::endl;
    }
}

void FleetRegistry::load(const std::string& path) {
    // Everything that can throw happens before the swap.
    FleetSnapshot snapshot = m_store->load(path);
    auto index = BuildIndex(snapshot.boats);

    m_boats = std::move(snapshot.boats);
    m_index = std::move(index);
    m_fleetLog = std::move(snapshot.fleetLog);

    if (m_verbose) {
        std::cout << "[FleetRegistry] Loaded " << m_boats.size() << " boats from " << path << std::endl;
    }
}

bool FleetRegistry::loadOrInitialize(const std::string& path) {
    if (!m_store->exists(path)) {
        m_boats.clear();
        m_index.clear();
        m_fleetLog.clear();
        if (m_verbose) {
            std::cout << "[FleetRegistry] No saved fleet data at " << path << ". Starting with empty fleet." << std::endl;
        }
        return false;
    }
    load(path);
    return true;
}

Boat& FleetRegistry::requireBoat(const std::string& id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        throw NotFoundError(id);
    }
    return m_boats[it->second];
}

const Boat& FleetRegistry::requireBoat(const std::string& id) const {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        throw NotFoundError(id);
    }
    return m_boats[it->second];
}

Timestamp FleetRegistry::resolveTimestamp(const std::optional<Timestamp>& timestamp) const {
    return TruncateToMillis(timestamp ? *timestamp : m_clock->now());
}

void FleetRegistry::appendLog(const std::string& message) {
    m_fleetLog.push_back(FleetLogEntry{TruncateToMillis(m_clock->now()), message});
}

std::unordered_map<std::string, size_t> FleetRegistry::BuildIndex(const std::vector<Boat>& boats) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < boats.size(); ++i) {
        if (!index.emplace(boats[i].getId(), i).second) {
            throw SchemaError("/boats/" + std::to_string(i) + "/id",
                              "duplicate boat id '" + boats[i].getId() + "'");
        }
    }
    return index;
}

} // namespace fleetkeeper::application
