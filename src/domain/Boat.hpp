/**
 * @file Boat.hpp
 * @brief Entity representing a tracked vessel and its history.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/ArrivalLogEntry.hpp"
#include "domain/FleetErrors.hpp"
#include "domain/LaunchDate.hpp"
#include "domain/PositionRecord.hpp"
#include "domain/VesselClass.hpp"

namespace fleetkeeper::domain {

/**
 * @class Boat
 * @brief A vessel with immutable identity, mutable descriptive attributes
 * and two append-only histories (positions and arrivals).
 *
 * Equality is by id.
 */
class Boat {
public:
    /**
     * @brief Constructor for Boat.
     * @throws InvalidInputError if id or name is empty.
     */
    Boat(std::string id, std::string name, std::string homePort, std::string flag)
        : m_id(std::move(id)),
          m_name(std::move(name)),
          m_homePort(std::move(homePort)),
          m_flag(std::move(flag)) {
        if (m_id.empty()) {
            throw InvalidInputError("Boat id cannot be empty.");
        }
        if (m_name.empty()) {
            throw InvalidInputError("Boat name cannot be empty.");
        }
    }

    // --- Accessors ---
    const std::string& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    const std::string& getHomePort() const { return m_homePort; }
    const std::string& getFlag() const { return m_flag; }
    const std::optional<LaunchDate>& getLaunchDate() const { return m_launchDate; }
    const VesselProfile& getProfile() const { return m_profile; }
    const std::vector<PositionRecord>& getPositions() const { return m_positions; }
    const std::vector<ArrivalLogEntry>& getArrivalLogs() const { return m_arrivalLogs; }

    /** @brief Most recent fix, if any was ever recorded. */
    std::optional<PositionRecord> currentPosition() const {
        if (m_positions.empty()) return std::nullopt;
        return m_positions.back();
    }

    // --- Mutators (descriptive attributes) ---
    void setName(const std::string& name) {
        if (name.empty()) {
            throw InvalidInputError("Boat name cannot be empty.");
        }
        m_name = name;
    }

    void setHomePort(const std::string& homePort) { m_homePort = homePort; }
    void setFlag(const std::string& flag) { m_flag = flag; }
    void setLaunchDate(const std::optional<LaunchDate>& date) { m_launchDate = date; }

    void setProfile(const VesselProfile& profile) {
        profile.validate();
        m_profile = profile;
    }

    // --- History (append-only) ---
    void appendPosition(const PositionRecord& record) {
        record.validate();
        m_positions.push_back(record);
    }

    void appendArrival(const ArrivalLogEntry& entry) {
        if (entry.port.empty()) {
            throw InvalidInputError("Arrival port cannot be empty.");
        }
        m_arrivalLogs.push_back(entry);
    }

    bool operator==(const Boat& other) const { return m_id == other.m_id; }
    bool operator!=(const Boat& other) const { return !(*this == other); }

private:
    std::string m_id;
    std::string m_name;
    std::string m_homePort;
    std::string m_flag;
    std::optional<LaunchDate> m_launchDate;
    VesselProfile m_profile;

    std::vector<PositionRecord> m_positions;
    std::vector<ArrivalLogEntry> m_arrivalLogs;
};

} // namespace fleetkeeper::domain
