/**
 * @file FleetFileStore.hpp
 * @brief JSON-file implementation of IFleetStore.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/IFleetStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fleetkeeper::infrastructure {

class FleetFileStore : public domain::IFleetStore {
public:
    /**
     * @param persistence Shared atomic file I/O service.
     * @param jsonIndent Indentation passed to json::dump (negative = compact).
     */
    explicit FleetFileStore(std::shared_ptr<PersistenceService> persistence, int jsonIndent = 2);

    void save(const std::string& path, const domain::FleetSnapshot& snapshot) override;
    domain::FleetSnapshot load(const std::string& path) override;
    bool exists(const std::string& path) const override;

private:
    std::shared_ptr<PersistenceService> m_persistence;
    int m_jsonIndent;
};

} // namespace fleetkeeper::infrastructure
