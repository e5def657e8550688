/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/FleetRegistry.hpp"
#include "domain/Clock.hpp"
#include "domain/IFleetStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace fleetkeeper::application {

struct AppServices {
    std::shared_ptr<const domain::Clock> clock;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::IFleetStore> fleetStore;
    std::unique_ptr<FleetRegistry> registry;
};

} // namespace fleetkeeper::application
