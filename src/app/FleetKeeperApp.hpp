/**
 * @file FleetKeeperApp.hpp
 * @brief Command-line front end wiring configuration, storage and the registry.
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "app/CommandLine.hpp"
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace fleetkeeper::app {

/**
 * @class FleetKeeperApp
 * @brief Runs one command per invocation: load, execute, save if the command mutated.
 *
 * Exit codes: 0 success, 1 registry/persistence error, 2 usage error.
 */
class FleetKeeperApp {
public:
    /** @param clock Time source; nullptr selects the system clock. */
    explicit FleetKeeperApp(std::shared_ptr<const domain::Clock> clock = nullptr);

    int Run(int argc, char** argv);

    /**
     * @brief Runs with explicit arguments and streams.
     * @param args Arguments without the program name.
     */
    int Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

private:
    /**
     * @brief Loads configuration, builds the services and rehydrates the registry.
     */
    void Init(const ParsedCommand& cmd, std::ostream& out);

    void Execute(const ParsedCommand& cmd, std::ostream& out);

    std::shared_ptr<const domain::Clock> m_clock;
    application::AppServices m_services;
    infrastructure::FleetConfig m_config;
    std::string m_dataFile;
};

} // namespace fleetkeeper::app
