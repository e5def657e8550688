/**
 * @file FleetRegistry.hpp
 * @brief Application Service owning the in-memory fleet.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "application/FleetReport.hpp"
#include "domain/Boat.hpp"
#include "domain/BoatQuery.hpp"
#include "domain/Clock.hpp"
#include "domain/FleetLogEntry.hpp"
#include "domain/IFleetStore.hpp"

namespace fleetkeeper::application {

/**
 * @class FleetRegistry
 * @brief Single source of truth for boats and their histories.
 *
 * Mutations only touch memory; the store is written by an explicit save().
 * Intended usage is "inspect, then save": list/filter to verify, then persist.
 * Not thread-safe. Callers that share one instance across threads must
 * serialize every call with one external lock.
 */
class FleetRegistry {
public:
    FleetRegistry(std::shared_ptr<domain::IFleetStore> store,
                  std::shared_ptr<const domain::Clock> clock);

    // --- Commands ---

    /**
     * @brief Registers a new boat with empty histories.
     * @throws domain::InvalidInputError if id or name is empty or the profile is invalid.
     * @throws domain::DuplicateIdError if id is already registered.
     */
    domain::Boat addBoat(const std::string& id,
                         const std::string& name,
                         const std::string& homePort,
                         const std::string& flag,
                         const std::optional<domain::LaunchDate>& launchDate = std::nullopt,
                         const domain::VesselProfile& profile = domain::VesselProfile::Standard());

    /**
     * @brief Applies the engaged fields of update; other fields stay unchanged.
     * @throws domain::NotFoundError, domain::InvalidInputError
     */
    domain::Boat updateBoat(const std::string& id, const domain::BoatUpdate& update);

    /**
     * @brief Drops the boat and its whole history.
     * @throws domain::NotFoundError
     */
    void removeBoat(const std::string& id);

    /**
     * @brief Appends a position fix; timestamp defaults to the clock's now.
     * @throws domain::NotFoundError, domain::InvalidInputError (coordinates out of range)
     */
    domain::PositionRecord recordPosition(const std::string& id,
                                          double latitude,
                                          double longitude,
                                          const std::optional<domain::Timestamp>& timestamp = std::nullopt);

    /**
     * @brief Appends an arrival; timestamp defaults to the clock's now.
     * @throws domain::NotFoundError, domain::InvalidInputError (empty port)
     */
    domain::ArrivalLogEntry recordArrival(const std::string& id,
                                          const std::string& port,
                                          const std::optional<domain::Timestamp>& timestamp = std::nullopt,
                                          const std::string& note = "");

    // --- Queries ---

    /** @brief All boats in insertion order. */
    std::vector<domain::Boat> listBoats() const;

    /** @brief Boats matching every engaged field of filter, in insertion order. */
    std::vector<domain::Boat> filterBoats(const domain::BoatFilter& filter) const;

    /**
     * @brief Stable, case-insensitive ascending sort of a copy of boats.
     */
    static std::vector<domain::Boat> sortBoats(std::vector<domain::Boat> boats,
                                               domain::SortKey key = domain::SortKey::Name);

    std::optional<domain::Boat> findBoat(const std::string& id) const;

    /** @throws domain::NotFoundError */
    std::vector<domain::PositionRecord> positionHistory(const std::string& id) const;

    const std::vector<domain::FleetLogEntry>& getFleetLog() const { return m_fleetLog; }

    FleetStatusReport statusReport() const;

    size_t boatCount() const { return m_boats.size(); }

    // --- Persistence ---

    /**
     * @brief Writes the full state to path.
     * @throws domain::PersistenceError; the previous file is left intact.
     */
    void save(const std::string& path) const;

    /**
     * @brief Replaces the full state with the document at path.
     * @throws domain::PersistenceError / domain::SchemaError; state is unchanged on failure.
     */
    void load(const std::string& path);

    /**
     * @brief Startup helper: load if path exists, otherwise start empty.
     * @return True if a document was loaded.
     */
    bool loadOrInitialize(const std::string& path);

    void setVerbose(bool verbose) { m_verbose = verbose; }

private:
    domain::Boat& requireBoat(const std::string& id);
    const domain::Boat& requireBoat(const std::string& id) const;
    domain::Timestamp resolveTimestamp(const std::optional<domain::Timestamp>& timestamp) const;
    void appendLog(const std::string& message);

    static std::unordered_map<std::string, size_t> BuildIndex(const std::vector<domain::Boat>& boats);

    std::shared_ptr<domain::IFleetStore> m_store;
    std::shared_ptr<const domain::Clock> m_clock;

    std::vector<domain::Boat> m_boats;                      ///< Insertion order.
    std::unordered_map<std::string, size_t> m_index;        ///< id -> position in m_boats.
    std::vector<domain::FleetLogEntry> m_fleetLog;
    bool m_verbose = false;
};

} // namespace fleetkeeper::application
