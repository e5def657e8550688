/**
 * @file FleetFileStore.cpp
 * @brief Implementation of FleetFileStore.
 */

#include "infrastructure/FleetFileStore.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/FleetErrors.hpp"
#include "infrastructure/FleetJsonCodec.hpp"

namespace fleetkeeper::infrastructure {

using json = nlohmann::json;

FleetFileStore::FleetFileStore(std::shared_ptr<PersistenceService> persistence, int jsonIndent)
    : m_persistence(std::move(persistence)), m_jsonIndent(jsonIndent) {}

void FleetFileStore::save(const std::string& path, const domain::FleetSnapshot& snapshot) {
    // Serialize fully before touching the disk so an encoding failure
    // cannot leave anything behind.
    std::string text;
    try {
        text = FleetJsonCodec::encode(snapshot).dump(m_jsonIndent);
    } catch (const json::exception& e) {
        std::cerr << "[FleetFileStore] Serialization failed: " << e.what() << std::endl;
        throw domain::PersistenceError(std::string("Cannot serialize fleet: ") + e.what());
    }
    text += "\n";
    m_persistence->writeTextAtomic(path, text);
}

domain::FleetSnapshot FleetFileStore::load(const std::string& path) {
    std::string text = m_persistence->readText(path);

    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[FleetFileStore] Malformed JSON in " << path << ": " << e.what() << std::endl;
        throw domain::SchemaError("", std::string("malformed JSON: ") + e.what());
    }

    try {
        return FleetJsonCodec::decode(document);
    } catch (const domain::SchemaError& e) {
        std::cerr << "[FleetFileStore] Rejected " << path << ": " << e.what() << std::endl;
        throw;
    } catch (const json::exception& e) {
        throw domain::SchemaError("", e.what());
    }
}

bool FleetFileStore::exists(const std::string& path) const {
    return m_persistence->exists(path);
}

} // namespace fleetkeeper::infrastructure
