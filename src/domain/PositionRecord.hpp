/**
 * @file PositionRecord.hpp
 * @brief Value Object for a timestamped coordinate fix.
 */

#pragma once

#include <string>
#include "domain/Clock.hpp"
#include "domain/FleetErrors.hpp"

namespace fleetkeeper::domain {

/**
 * @struct PositionRecord
 * @brief One entry of a boat's position history.
 *
 * Invariant: latitude in [-90, 90], longitude in [-180, 180].
 * Never edited once appended to a Boat.
 */
struct PositionRecord {
    double latitude = 0.0;
    double longitude = 0.0;
    Timestamp timestamp;

    PositionRecord() = default;

    PositionRecord(double lat, double lon, Timestamp ts)
        : latitude(lat), longitude(lon), timestamp(ts) {
        validate();
    }

    void validate() const {
        // NaN fails both comparisons and is rejected here as well.
        if (!(latitude >= -90.0 && latitude <= 90.0)) {
            throw InvalidInputError("Latitude must be within [-90, 90], got " + std::to_string(latitude));
        }
        if (!(longitude >= -180.0 && longitude <= 180.0)) {
            throw InvalidInputError("Longitude must be within [-180, 180], got " + std::to_string(longitude));
        }
    }

    bool operator==(const PositionRecord& other) const {
        return latitude == other.latitude &&
               longitude == other.longitude &&
               timestamp == other.timestamp;
    }

    bool operator!=(const PositionRecord& other) const { return !(*this == other); }
};

} // namespace fleetkeeper::domain
