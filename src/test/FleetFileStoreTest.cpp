#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "application/FleetRegistry.hpp"
#include "infrastructure/FleetFileStore.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestSupport.hpp"

using namespace fleetkeeper::domain;
using fleetkeeper::application::FleetRegistry;
using fleetkeeper::infrastructure::FleetFileStore;
using fleetkeeper::infrastructure::PersistenceService;
using fleetkeeper::test::ManualClock;
using fleetkeeper::test::ScopedTempDir;
using fleetkeeper::test::Throws;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<FleetFileStore> MakeStore() {
    return std::make_shared<FleetFileStore>(std::make_shared<PersistenceService>());
}

void WriteFile(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int CountTempFiles(const fs::path& dir) {
    int count = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") ++count;
    }
    return count;
}

void testSaveCreatesFileAndNoTemps() {
    ScopedTempDir dir("fleet_store_save");
    auto store = MakeStore();
    auto clock = std::make_shared<ManualClock>();
    FleetRegistry registry(store, clock);
    registry.addBoat("B1", "Orion", "Oslo", "NO");

    // Parent directories are created on demand.
    const std::string path = dir.file("nested/fleet.json");
    registry.save(path);
    assert(fs::is_regular_file(path));
    assert(CountTempFiles(dir.path() / "nested") == 0);

    std::string first = ReadFile(path);
    assert(first.find("\"Orion\"") != std::string::npos);

    // Overwrite replaces the content in place.
    registry.addBoat("B2", "Vega", "Bergen", "NO");
    registry.save(path);
    std::string second = ReadFile(path);
    assert(second.find("\"Vega\"") != std::string::npos);
    assert(CountTempFiles(dir.path() / "nested") == 0);
}

void testLoadMissingFile() {
    ScopedTempDir dir("fleet_store_missing");
    auto store = MakeStore();
    const std::string path = dir.file("absent.json");
    assert(!store->exists(path));

    bool persistence = false;
    try {
        store->load(path);
    } catch (const SchemaError&) {
        assert(false && "missing file is not a schema problem");
    } catch (const PersistenceError&) {
        persistence = true;
    }
    assert(persistence);
}

void testMalformedAndInvalidDocuments() {
    ScopedTempDir dir("fleet_store_malformed");
    auto store = MakeStore();

    const std::string garbage = dir.file("garbage.json");
    WriteFile(garbage, "{ \"boats\": [ { \"id\": ");
    assert(Throws<SchemaError>([&] { store->load(garbage); }));

    const std::string badShape = dir.file("bad_shape.json");
    WriteFile(badShape, R"({"version": 1, "boats": [{"name": "No Id"}]})");
    try {
        store->load(badShape);
        assert(false && "expected SchemaError");
    } catch (const SchemaError& e) {
        assert(e.where() == "/boats/0");
    }
}

void testFailedLoadKeepsRegistryState() {
    ScopedTempDir dir("fleet_store_keep_state");
    auto clock = std::make_shared<ManualClock>();
    FleetRegistry registry(MakeStore(), clock);
    registry.addBoat("B1", "Orion", "Oslo", "NO");
    registry.recordPosition("B1", 10.0, 20.0);

    const std::string broken = dir.file("broken.json");
    WriteFile(broken, R"({"boats": [{"id": "X", "name": "One"}, {"id": "X", "name": "Two"}]})");
    assert(Throws<SchemaError>([&] { registry.load(broken); }));

    assert(registry.boatCount() == 1);
    assert(registry.findBoat("B1"));
    assert(!registry.findBoat("X"));
    assert(registry.positionHistory("B1").size() == 1);

    assert(Throws<PersistenceError>([&] { registry.load(dir.file("nope.json")); }));
    assert(registry.boatCount() == 1);
}

void testFailedSaveLeavesTargetIntact() {
    ScopedTempDir dir("fleet_store_save_fail");
    auto clock = std::make_shared<ManualClock>();
    FleetRegistry registry(MakeStore(), clock);
    registry.addBoat("B1", "Orion", "Oslo", "NO");

    // A non-empty directory cannot be replaced by a file.
    const fs::path target = dir.path() / "occupied";
    fs::create_directories(target);
    WriteFile((target / "keep.txt").string(), "keep");

    assert(Throws<PersistenceError>([&] { registry.save(target.string()); }));
    assert(fs::is_directory(target));
    assert(ReadFile((target / "keep.txt").string()) == "keep");
    assert(CountTempFiles(dir.path()) == 0);
}

void testLoadOrInitialize() {
    ScopedTempDir dir("fleet_store_init");
    auto clock = std::make_shared<ManualClock>();
    const std::string path = dir.file("fleet.json");

    FleetRegistry fresh(MakeStore(), clock);
    assert(!fresh.loadOrInitialize(path));
    assert(fresh.boatCount() == 0);
    assert(!fs::exists(path));

    fresh.addBoat("B1", "Orion", "Oslo", "NO");
    fresh.save(path);

    FleetRegistry reopened(MakeStore(), clock);
    assert(reopened.loadOrInitialize(path));
    assert(reopened.boatCount() == 1);
    assert(reopened.findBoat("B1")->getName() == "Orion");
}

void testCompactIndent() {
    ScopedTempDir dir("fleet_store_indent");
    auto store = std::make_shared<FleetFileStore>(std::make_shared<PersistenceService>(), -1);
    FleetSnapshot snapshot;
    snapshot.boats.emplace_back("B1", "Orion", "Oslo", "NO");

    const std::string path = dir.file("compact.json");
    store->save(path, snapshot);
    std::string text = ReadFile(path);
    // One line of JSON followed by the trailing newline.
    assert(text.find('\n') == text.size() - 1);
    assert(store->load(path).boats.size() == 1);
}

} // namespace

int main() {
    std::cout << "[Test] Starting FleetFileStore Test..." << std::endl;

    testSaveCreatesFileAndNoTemps();
    testLoadMissingFile();
    testMalformedAndInvalidDocuments();
    testFailedLoadKeepsRegistryState();
    testFailedSaveLeavesTargetIntact();
    testLoadOrInitialize();
    testCompactIndent();

    std::cout << "[PASS] FleetFileStore Test." << std::endl;
    return 0;
}
