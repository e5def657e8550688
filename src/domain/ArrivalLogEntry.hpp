/**
 * @file ArrivalLogEntry.hpp
 * @brief Value Object for a recorded port arrival.
 */

#pragma once

#include <string>
#include "domain/Clock.hpp"
#include "domain/FleetErrors.hpp"

namespace fleetkeeper::domain {

/**
 * @struct ArrivalLogEntry
 * @brief One entry of a boat's arrival log.
 *
 * Invariant: port is not empty.
 */
struct ArrivalLogEntry {
    std::string port;       ///< Where the boat arrived.
    Timestamp timestamp;    ///< When it arrived.
    std::string note;       ///< Free text, may be empty.

    ArrivalLogEntry() = default;

    ArrivalLogEntry(std::string p, Timestamp ts, std::string n = "")
        : port(std::move(p)), timestamp(ts), note(std::move(n)) {
        if (port.empty()) {
            throw InvalidInputError("Arrival port cannot be empty.");
        }
    }

    bool operator==(const ArrivalLogEntry& other) const {
        return port == other.port &&
               timestamp == other.timestamp &&
               note == other.note;
    }

    bool operator!=(const ArrivalLogEntry& other) const { return !(*this == other); }
};

} // namespace fleetkeeper::domain
