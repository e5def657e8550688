/**
 * @file IFleetStore.hpp
 * @brief Interface for durable storage of a fleet snapshot.
 */

#pragma once

#include <string>
#include "domain/FleetSnapshot.hpp"

namespace fleetkeeper::domain {

class IFleetStore {
public:
    virtual ~IFleetStore() = default;

    /**
     * @brief Overwrites the document at path with the snapshot.
     * @throws PersistenceError on any I/O failure; the previous document stays intact.
     */
    virtual void save(const std::string& path, const FleetSnapshot& snapshot) = 0;

    /**
     * @brief Reads and validates the document at path.
     * @throws PersistenceError if missing or unreadable, SchemaError if invalid.
     */
    virtual FleetSnapshot load(const std::string& path) = 0;

    /** @brief True if a document exists at path. */
    virtual bool exists(const std::string& path) const = 0;
};

} // namespace fleetkeeper::domain
