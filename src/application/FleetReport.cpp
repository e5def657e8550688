/**
 * @file FleetReport.cpp
 * @brief Implementation of BuildStatusReport.
 */

#include "application/FleetReport.hpp"

namespace fleetkeeper::application {

FleetStatusReport BuildStatusReport(const std::vector<domain::Boat>& boats) {
    FleetStatusReport report;
    report.total = boats.size();
    for (const auto& boat : boats) {
        switch (boat.getProfile().vesselClass) {
            case domain::VesselClass::Cargo:
                ++report.cargo;
                report.totalCargoCapacity += boat.getProfile().cargoCapacity;
                break;
            case domain::VesselClass::Military:
                ++report.military;
                break;
            case domain::VesselClass::Standard:
            default:
                ++report.standard;
                break;
        }
        report.totalPositions += boat.getPositions().size();
        report.totalArrivals += boat.getArrivalLogs().size();
    }
    return report;
}

} // namespace fleetkeeper::application
