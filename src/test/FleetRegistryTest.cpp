#include <cassert>
#include <iostream>
#include <memory>

#include "application/FleetRegistry.hpp"
#include "test/TestSupport.hpp"

using namespace fleetkeeper::domain;
using fleetkeeper::application::FleetRegistry;
using fleetkeeper::test::ManualClock;
using fleetkeeper::test::MemoryFleetStore;
using fleetkeeper::test::Throws;

namespace {

struct Fixture {
    std::shared_ptr<MemoryFleetStore> store = std::make_shared<MemoryFleetStore>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    FleetRegistry registry{store, clock};
};

void testAddAndList() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.registry.addBoat("B2", "Aurora", "Bergen", "NO");
    Boat third = f.registry.addBoat("B3", "Zephyr", "Cadiz", "ES");
    assert(third.getId() == "B3" && third.getPositions().empty() && third.getArrivalLogs().empty());

    auto boats = f.registry.listBoats();
    assert(boats.size() == 3);
    assert(boats[0].getId() == "B1");
    assert(boats[1].getId() == "B2");
    assert(boats[2].getId() == "B3");
    assert(f.registry.boatCount() == 3);

    // Nothing is persisted without an explicit save.
    assert(f.store->saveCalls == 0);
}

void testAddRejections() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.clock->advance(std::chrono::seconds(1));
    const size_t logBefore = f.registry.getFleetLog().size();

    assert(Throws<DuplicateIdError>([&] { f.registry.addBoat("B1", "Impostor", "Rome", "IT"); }));
    assert(f.registry.boatCount() == 1);
    assert(f.registry.findBoat("B1")->getName() == "Orion");
    assert(f.registry.getFleetLog().size() == logBefore);

    try {
        f.registry.addBoat("B1", "Impostor", "Rome", "IT");
        assert(false && "expected DuplicateIdError");
    } catch (const DuplicateIdError& e) {
        assert(e.boatId() == "B1");
    }

    assert(Throws<InvalidInputError>([&] { f.registry.addBoat("", "NoId", "Rome", "IT"); }));
    assert(Throws<InvalidInputError>([&] { f.registry.addBoat("B2", "", "Rome", "IT"); }));
    assert(Throws<InvalidInputError>([&] {
        f.registry.addBoat("B3", "Hauler", "Rome", "IT", std::nullopt, VesselProfile{VesselClass::Cargo, -5.0, 0, false});
    }));
    assert(f.registry.boatCount() == 1);

    // All of these are FleetErrors.
    assert(Throws<FleetError>([&] { f.registry.addBoat("B1", "Again", "", ""); }));
}

void testAddWithSupplementaryAttributes() {
    Fixture f;
    Boat cargo = f.registry.addBoat("C1", "Hauler", "Rotterdam", "NL",
                                    LaunchDate(2010, 5, 17), VesselProfile::Cargo(5000.0));
    assert(cargo.getLaunchDate() && cargo.getLaunchDate()->toString() == "2010-05-17");
    assert(cargo.getProfile().vesselClass == VesselClass::Cargo);
    assert(cargo.getProfile().cargoCapacity == 5000.0);
}

void testUpdate() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.registry.recordPosition("B1", 10.0, 10.0);

    BoatUpdate portOnly;
    portOnly.homePort = "Trondheim";
    Boat updated = f.registry.updateBoat("B1", portOnly);
    assert(updated.getHomePort() == "Trondheim");
    assert(updated.getName() == "Orion");
    assert(updated.getFlag() == "NO");
    assert(updated.getPositions().size() == 1);

    BoatUpdate several;
    several.name = "Orion II";
    several.flag = "SE";
    several.launchDate = LaunchDate(2001, 1, 1);
    several.profile = VesselProfile::Military(2, true);
    updated = f.registry.updateBoat("B1", several);
    assert(updated.getName() == "Orion II" && updated.getFlag() == "SE");
    assert(updated.getHomePort() == "Trondheim");
    assert(updated.getLaunchDate()->year == 2001);
    assert(updated.getProfile().weaponCount == 2);

    BoatUpdate clear;
    clear.clearLaunchDate = true;
    clear.launchDate = LaunchDate(2005, 5, 5);
    assert(!f.registry.updateBoat("B1", clear).getLaunchDate());

    // Rejected update leaves everything unchanged.
    BoatUpdate bad;
    bad.homePort = "Should Not Apply";
    bad.name = "";
    assert(Throws<InvalidInputError>([&] { f.registry.updateBoat("B1", bad); }));
    assert(f.registry.findBoat("B1")->getHomePort() == "Trondheim");
    assert(f.registry.findBoat("B1")->getName() == "Orion II");

    assert(Throws<NotFoundError>([&] { f.registry.updateBoat("nope", portOnly); }));
}

void testRemove() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.registry.addBoat("B2", "Aurora", "Bergen", "NO");
    f.registry.addBoat("B3", "Zephyr", "Cadiz", "ES");
    f.registry.recordPosition("B2", 1.0, 1.0);

    assert(Throws<NotFoundError>([&] { f.registry.removeBoat("B9"); }));
    assert(f.registry.boatCount() == 3);

    f.registry.removeBoat("B2");
    assert(f.registry.boatCount() == 2);
    assert(!f.registry.findBoat("B2"));
    auto boats = f.registry.listBoats();
    assert(boats[0].getId() == "B1" && boats[1].getId() == "B3");

    // Index stays consistent after the erase.
    f.registry.recordPosition("B3", 2.0, 2.0);
    assert(f.registry.findBoat("B3")->getPositions().size() == 1);

    // Re-adding under the same id starts fresh.
    Boat again = f.registry.addBoat("B2", "Aurora Reborn", "Bergen", "NO");
    assert(again.getPositions().empty());
    assert(f.registry.listBoats().back().getId() == "B2");
}

void testRecordPosition() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");

    const Timestamp t0 = ManualClock::FromEpochSeconds(1600000000);
    f.registry.recordPosition("B1", 10.0, 20.0, t0);

    assert(Throws<InvalidInputError>([&] { f.registry.recordPosition("B1", 95.0, 0.0); }));
    assert(Throws<InvalidInputError>([&] { f.registry.recordPosition("B1", 0.0, -181.0); }));
    assert(f.registry.positionHistory("B1").size() == 1);

    PositionRecord rec = f.registry.recordPosition("B1", 45.0, -122.0);
    assert(rec.latitude == 45.0 && rec.longitude == -122.0);
    assert(rec.timestamp == f.clock->now());

    auto history = f.registry.positionHistory("B1");
    assert(history.size() == 2);
    assert(history[0] == PositionRecord(10.0, 20.0, t0));
    assert(history[1] == rec);
    assert(f.registry.findBoat("B1")->currentPosition()->latitude == 45.0);

    assert(Throws<NotFoundError>([&] { f.registry.recordPosition("ghost", 0.0, 0.0); }));
    assert(Throws<NotFoundError>([&] { f.registry.positionHistory("ghost"); }));

    // Timestamps are kept at millisecond resolution.
    const Timestamp fine = t0 + std::chrono::microseconds(1500);
    PositionRecord truncated = f.registry.recordPosition("B1", 0.0, 0.0, fine);
    assert(truncated.timestamp == t0 + std::chrono::milliseconds(1));
}

void testRecordArrival() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");

    const Timestamp t = ManualClock::FromEpochSeconds(1650000000);
    ArrivalLogEntry entry = f.registry.recordArrival("B1", "Seattle", t, "on schedule");
    assert(entry == ArrivalLogEntry("Seattle", t, "on schedule"));

    ArrivalLogEntry defaulted = f.registry.recordArrival("B1", "Tacoma");
    assert(defaulted.timestamp == f.clock->now());
    assert(defaulted.note.empty());

    assert(Throws<InvalidInputError>([&] { f.registry.recordArrival("B1", ""); }));
    assert(Throws<NotFoundError>([&] { f.registry.recordArrival("ghost", "Seattle"); }));

    auto logs = f.registry.findBoat("B1")->getArrivalLogs();
    assert(logs.size() == 2);
    assert(logs[0].port == "Seattle" && logs[1].port == "Tacoma");
}

void testFleetLogAndReport() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.clock->advance(std::chrono::minutes(5));
    f.registry.addBoat("C1", "Hauler", "Rotterdam", "NL", std::nullopt, VesselProfile::Cargo(1000.0));
    f.registry.addBoat("C2", "Barge", "Antwerp", "BE", std::nullopt, VesselProfile::Cargo(250.5));
    f.registry.addBoat("M1", "Guardian", "Portsmouth", "UK", std::nullopt, VesselProfile::Military(8, true));
    f.registry.recordArrival("B1", "Seattle");
    f.registry.recordPosition("B1", 1.0, 1.0);
    f.registry.removeBoat("C2");

    const auto& log = f.registry.getFleetLog();
    assert(log.size() == 6);
    assert(log[0].message == "Orion joined the fleet.");
    assert(log[0].timestamp == ManualClock().now());
    assert(log[1].timestamp == ManualClock().now() + std::chrono::minutes(5));
    assert(log[4].message == "Orion arrived at Seattle.");
    assert(log[5].message == "Barge was removed from the fleet.");

    auto report = f.registry.statusReport();
    assert(report.total == 3);
    assert(report.standard == 1);
    assert(report.cargo == 1);
    assert(report.military == 1);
    assert(report.totalCargoCapacity == 1000.0);
    assert(report.totalPositions == 1);
    assert(report.totalArrivals == 1);
}

void testSaveAndLoadThroughStore() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.registry.recordPosition("B1", 45.0, -122.0);
    f.registry.save("fleet_data.json");
    assert(f.store->saveCalls == 1);

    const FleetSnapshot& written = f.store->documents.at("fleet_data.json");
    assert(written.boats.size() == 1);
    assert(written.savedAt && *written.savedAt == f.clock->now());

    // Mutations after save are not on "disk" until the next save.
    f.registry.addBoat("B2", "Aurora", "Bergen", "NO");
    assert(f.store->documents.at("fleet_data.json").boats.size() == 1);

    // load replaces, never merges.
    f.registry.load("fleet_data.json");
    assert(f.registry.boatCount() == 1);
    assert(!f.registry.findBoat("B2"));
    assert(f.registry.findBoat("B1")->getPositions().size() == 1);

    // A failed load keeps the current state.
    f.registry.addBoat("B3", "Zephyr", "Cadiz", "ES");
    assert(Throws<PersistenceError>([&] { f.registry.load("missing.json"); }));
    assert(f.registry.boatCount() == 2);

    // Duplicate ids coming back from a store are rejected before state is swapped.
    FleetSnapshot corrupt;
    corrupt.boats.emplace_back("X", "One", "", "");
    corrupt.boats.emplace_back("X", "Two", "", "");
    f.store->documents["corrupt.json"] = corrupt;
    assert(Throws<SchemaError>([&] { f.registry.load("corrupt.json"); }));
    assert(f.registry.boatCount() == 2);

    // Failed save surfaces the error.
    f.store->failSaves = true;
    assert(Throws<PersistenceError>([&] { f.registry.save("fleet_data.json"); }));
    assert(f.store->documents.at("fleet_data.json").boats.size() == 1);
}

void testLoadOrInitialize() {
    Fixture f;
    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    assert(!f.registry.loadOrInitialize("absent.json"));
    assert(f.registry.boatCount() == 0);
    assert(f.registry.getFleetLog().empty());

    f.registry.addBoat("B1", "Orion", "Oslo", "NO");
    f.registry.save("present.json");
    f.registry.removeBoat("B1");
    assert(f.registry.loadOrInitialize("present.json"));
    assert(f.registry.boatCount() == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting FleetRegistry Test..." << std::endl;

    testAddAndList();
    testAddRejections();
    testAddWithSupplementaryAttributes();
    testUpdate();
    testRemove();
    testRecordPosition();
    testRecordArrival();
    testFleetLogAndReport();
    testSaveAndLoadThroughStore();
    testLoadOrInitialize();

    std::cout << "[PASS] FleetRegistry Test." << std::endl;
    return 0;
}
