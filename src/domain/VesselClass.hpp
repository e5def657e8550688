/**
 * @file VesselClass.hpp
 * @brief Value Objects describing what kind of vessel a boat is.
 */

#pragma once

#include <cmath>
#include <optional>
#include <string>
#include "domain/FleetErrors.hpp"

namespace fleetkeeper::domain {

/**
 * @enum VesselClass
 * @brief Category of a boat; selects which class-specific attributes apply.
 */
enum class VesselClass {
    Standard,   ///< No extra attributes.
    Cargo,      ///< Carries cargo_capacity (tons).
    Military    ///< Carries weapon_count and government authorisation.
};

inline std::string VesselClassToString(VesselClass vc) {
    switch (vc) {
        case VesselClass::Standard: return "standard";
        case VesselClass::Cargo: return "cargo";
        case VesselClass::Military: return "military";
        default: return "standard";
    }
}

/**
 * @brief Parses the persisted/class name.
 * @return nullopt for unknown names.
 */
inline std::optional<VesselClass> VesselClassFromString(const std::string& text) {
    if (text == "standard") return VesselClass::Standard;
    if (text == "cargo") return VesselClass::Cargo;
    if (text == "military") return VesselClass::Military;
    return std::nullopt;
}

/**
 * @struct VesselProfile
 * @brief Class plus the attributes that belong to it.
 *
 * Attributes of other classes are kept at their defaults.
 */
struct VesselProfile {
    VesselClass vesselClass = VesselClass::Standard;
    double cargoCapacity = 0.0;         ///< Tons, Cargo only.
    int weaponCount = 0;                ///< Military only.
    bool governmentAuthorised = false;  ///< Military only.

    static VesselProfile Standard() { return VesselProfile{}; }

    static VesselProfile Cargo(double capacityTons) {
        VesselProfile p;
        p.vesselClass = VesselClass::Cargo;
        p.cargoCapacity = capacityTons;
        p.validate();
        return p;
    }

    static VesselProfile Military(int weapons, bool authorised) {
        VesselProfile p;
        p.vesselClass = VesselClass::Military;
        p.weaponCount = weapons;
        p.governmentAuthorised = authorised;
        p.validate();
        return p;
    }

    void validate() const {
        if (!std::isfinite(cargoCapacity) || cargoCapacity < 0.0) {
            throw InvalidInputError("Cargo capacity must be a finite, zero or positive number.");
        }
        if (weaponCount < 0) {
            throw InvalidInputError("Weapon count must be zero or positive.");
        }
    }

    bool operator==(const VesselProfile& other) const {
        return vesselClass == other.vesselClass &&
               cargoCapacity == other.cargoCapacity &&
               weaponCount == other.weaponCount &&
               governmentAuthorised == other.governmentAuthorised;
    }
    bool operator!=(const VesselProfile& other) const { return !(*this == other); }
};

} // namespace fleetkeeper::domain
