/**
 * @file FleetReport.hpp
 * @brief Aggregate figures over a set of boats.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "domain/Boat.hpp"

namespace fleetkeeper::application {

/**
 * @struct FleetStatusReport
 * @brief Fleet composition and history volume.
 */
struct FleetStatusReport {
    size_t total = 0;
    size_t standard = 0;
    size_t cargo = 0;
    size_t military = 0;
    double totalCargoCapacity = 0.0;   ///< Tons, summed over cargo boats.
    size_t totalPositions = 0;
    size_t totalArrivals = 0;
};

FleetStatusReport BuildStatusReport(const std::vector<domain::Boat>& boats);

} // namespace fleetkeeper::application
