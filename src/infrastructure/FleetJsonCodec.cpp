/**
 * @file FleetJsonCodec.cpp
 * @brief Implementation of FleetJsonCodec.
 */

#include "infrastructure/FleetJsonCodec.hpp"
#include <cstdint>
#include <limits>
#include <unordered_set>
#include "domain/FleetErrors.hpp"
#include "infrastructure/TimeFormat.hpp"

namespace fleetkeeper::infrastructure {

using json = nlohmann::json;
using namespace fleetkeeper::domain;

namespace {

std::string Child(const std::string& where, const std::string& key) {
    return where + "/" + key;
}

std::string Child(const std::string& where, size_t index) {
    return where + "/" + std::to_string(index);
}

const json& RequireField(const json& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw SchemaError(where, "missing required field '" + key + "'");
    }
    return *it;
}

std::string RequireString(const json& obj, const std::string& key, const std::string& where) {
    const json& value = RequireField(obj, key, where);
    if (!value.is_string()) {
        throw SchemaError(Child(where, key), "expected a string");
    }
    return value.get<std::string>();
}

std::string OptionalString(const json& obj, const std::string& key, const std::string& where,
                           const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (!it->is_string()) {
        throw SchemaError(Child(where, key), "expected a string");
    }
    return it->get<std::string>();
}

double RequireNumber(const json& obj, const std::string& key, const std::string& where) {
    const json& value = RequireField(obj, key, where);
    if (!value.is_number()) {
        throw SchemaError(Child(where, key), "expected a number");
    }
    return value.get<double>();
}

Timestamp RequireTimestamp(const json& obj, const std::string& key, const std::string& where) {
    std::string text = RequireString(obj, key, where);
    auto ts = TimeFormat::ParseIso8601(text);
    if (!ts) {
        throw SchemaError(Child(where, key), "unrecognized timestamp '" + text + "'");
    }
    return *ts;
}

const json* OptionalArray(const json& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    if (!it->is_array()) {
        throw SchemaError(Child(where, key), "expected an array");
    }
    return &(*it);
}

json EncodeBoat(const Boat& boat) {
    json j = {
        {"id", boat.getId()},
        {"name", boat.getName()},
        {"home_port", boat.getHomePort()},
        {"flag", boat.getFlag()}
    };
    if (boat.getLaunchDate()) {
        j["launch_date"] = boat.getLaunchDate()->toString();
    }

    const VesselProfile& profile = boat.getProfile();
    j["class"] = VesselClassToString(profile.vesselClass);
    if (profile.vesselClass == VesselClass::Cargo) {
        j["cargo_capacity"] = profile.cargoCapacity;
    } else if (profile.vesselClass == VesselClass::Military) {
        j["weapon_count"] = profile.weaponCount;
        j["government_authorised"] = profile.governmentAuthorised;
    }

    json positions = json::array();
    for (const auto& p : boat.getPositions()) {
        positions.push_back({
            {"latitude", p.latitude},
            {"longitude", p.longitude},
            {"timestamp", TimeFormat::FormatIso8601(p.timestamp)}
        });
    }
    j["positions"] = std::move(positions);

    json arrivals = json::array();
    for (const auto& a : boat.getArrivalLogs()) {
        arrivals.push_back({
            {"port", a.port},
            {"timestamp", TimeFormat::FormatIso8601(a.timestamp)},
            {"note", a.note}
        });
    }
    j["arrival_logs"] = std::move(arrivals);
    return j;
}

VesselProfile DecodeProfile(const json& obj, const std::string& where) {
    std::string className = OptionalString(obj, "class", where, "standard");
    auto vesselClass = VesselClassFromString(className);
    if (!vesselClass) {
        throw SchemaError(Child(where, "class"), "unknown vessel class '" + className + "'");
    }

    VesselProfile profile;
    profile.vesselClass = *vesselClass;

    if (*vesselClass == VesselClass::Cargo) {
        auto it = obj.find("cargo_capacity");
        if (it != obj.end()) {
            if (!it->is_number()) throw SchemaError(Child(where, "cargo_capacity"), "expected a number");
            profile.cargoCapacity = it->get<double>();
        }
    } else if (*vesselClass == VesselClass::Military) {
        auto it = obj.find("weapon_count");
        if (it != obj.end()) {
            if (!it->is_number_integer()) throw SchemaError(Child(where, "weapon_count"), "expected an integer");
            // Unsigned values are checked before any signed read so large ones cannot wrap.
            const bool fits = it->is_number_unsigned()
                ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                : (it->get<std::int64_t>() >= 0 && it->get<std::int64_t>() <= std::numeric_limits<int>::max());
            if (!fits) throw SchemaError(Child(where, "weapon_count"), "expected an integer in [0, 2147483647]");
            profile.weaponCount = static_cast<int>(it->get<std::int64_t>());
        }
        auto auth = obj.find("government_authorised");
        if (auth != obj.end()) {
            if (!auth->is_boolean()) throw SchemaError(Child(where, "government_authorised"), "expected a boolean");
            profile.governmentAuthorised = auth->get<bool>();
        }
    }

    try {
        profile.validate();
    } catch (const InvalidInputError& e) {
        throw SchemaError(where, e.what());
    }
    return profile;
}

Boat DecodeBoat(const json& obj, const std::string& where) {
    if (!obj.is_object()) {
        throw SchemaError(where, "expected an object");
    }

    std::string id = RequireString(obj, "id", where);
    std::string name = RequireString(obj, "name", where);
    if (id.empty()) throw SchemaError(Child(where, "id"), "boat id cannot be empty");
    if (name.empty()) throw SchemaError(Child(where, "name"), "boat name cannot be empty");

    Boat boat(id, name, OptionalString(obj, "home_port", where), OptionalString(obj, "flag", where));

    auto launch = obj.find("launch_date");
    if (launch != obj.end() && !launch->is_null()) {
        if (!launch->is_string()) throw SchemaError(Child(where, "launch_date"), "expected a string");
        try {
            boat.setLaunchDate(LaunchDate::Parse(launch->get<std::string>()));
        } catch (const InvalidInputError& e) {
            throw SchemaError(Child(where, "launch_date"), e.what());
        }
    }

    boat.setProfile(DecodeProfile(obj, where));

    if (const json* positions = OptionalArray(obj, "positions", where)) {
        const std::string base = Child(where, "positions");
        for (size_t i = 0; i < positions->size(); ++i) {
            const json& p = (*positions)[i];
            const std::string at = Child(base, i);
            if (!p.is_object()) throw SchemaError(at, "expected an object");
            double lat = RequireNumber(p, "latitude", at);
            double lon = RequireNumber(p, "longitude", at);
            Timestamp ts = RequireTimestamp(p, "timestamp", at);
            try {
                boat.appendPosition(PositionRecord(lat, lon, ts));
            } catch (const InvalidInputError& e) {
                throw SchemaError(at, e.what());
            }
        }
    }

    if (const json* arrivals = OptionalArray(obj, "arrival_logs", where)) {
        const std::string base = Child(where, "arrival_logs");
        for (size_t i = 0; i < arrivals->size(); ++i) {
            const json& a = (*arrivals)[i];
            const std::string at = Child(base, i);
            if (!a.is_object()) throw SchemaError(at, "expected an object");
            std::string port = RequireString(a, "port", at);
            if (port.empty()) throw SchemaError(Child(at, "port"), "arrival port cannot be empty");
            Timestamp ts = RequireTimestamp(a, "timestamp", at);
            boat.appendArrival(ArrivalLogEntry(port, ts, OptionalString(a, "note", at)));
        }
    }

    return boat;
}

} // namespace

json FleetJsonCodec::encode(const FleetSnapshot& snapshot) {
    json doc;
    doc["version"] = kCurrentVersion;
    if (snapshot.savedAt) {
        doc["saved_at"] = TimeFormat::FormatIso8601(*snapshot.savedAt);
    }

    json boats = json::array();
    for (const auto& boat : snapshot.boats) {
        boats.push_back(EncodeBoat(boat));
    }
    doc["boats"] = std::move(boats);

    json log = json::array();
    for (const auto& entry : snapshot.fleetLog) {
        log.push_back({
            {"timestamp", TimeFormat::FormatIso8601(entry.timestamp)},
            {"message", entry.message}
        });
    }
    doc["fleet_log"] = std::move(log);
    return doc;
}

FleetSnapshot FleetJsonCodec::decode(const json& document) {
    if (!document.is_object()) {
        throw SchemaError("", "document root must be an object");
    }

    int version = kCurrentVersion;
    auto it = document.find("version");
    if (it != document.end()) {
        if (!it->is_number_integer()) {
            throw SchemaError("/version", "expected an integer");
        }
        version = it->get<int>();
    }

    // Migration dispatch: one branch per known on-disk version.
    switch (version) {
        case 1:
            return decodeVersion1(document);
        default:
            throw SchemaError("/version", "unsupported document version " + std::to_string(version));
    }
}

FleetSnapshot FleetJsonCodec::decodeVersion1(const json& document) {
    FleetSnapshot snapshot;

    const json* boats = OptionalArray(document, "boats", "");
    if (!boats) {
        throw SchemaError("", "missing required field 'boats'");
    }

    std::unordered_set<std::string> seenIds;
    for (size_t i = 0; i < boats->size(); ++i) {
        const std::string where = Child("/boats", i);
        Boat boat = DecodeBoat((*boats)[i], where);
        if (!seenIds.insert(boat.getId()).second) {
            throw SchemaError(Child(where, "id"), "duplicate boat id '" + boat.getId() + "'");
        }
        snapshot.boats.push_back(std::move(boat));
    }

    if (const json* log = OptionalArray(document, "fleet_log", "")) {
        for (size_t i = 0; i < log->size(); ++i) {
            const json& e = (*log)[i];
            const std::string at = Child("/fleet_log", i);
            if (!e.is_object()) throw SchemaError(at, "expected an object");
            FleetLogEntry entry;
            entry.timestamp = RequireTimestamp(e, "timestamp", at);
            entry.message = RequireString(e, "message", at);
            snapshot.fleetLog.push_back(std::move(entry));
        }
    }

    auto savedAt = document.find("saved_at");
    if (savedAt != document.end() && savedAt->is_string()) {
        snapshot.savedAt = TimeFormat::ParseIso8601(savedAt->get<std::string>());
    }

    return snapshot;
}

} // namespace fleetkeeper::infrastructure
