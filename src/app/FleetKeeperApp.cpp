/**
 * @file FleetKeeperApp.cpp
 * @brief Implementation of FleetKeeperApp.
 */

#include "app/FleetKeeperApp.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>

#include "domain/FleetErrors.hpp"
#include "infrastructure/FleetFileStore.hpp"
#include "infrastructure/TimeFormat.hpp"

namespace fleetkeeper::app {

namespace fs = std::filesystem;
using namespace fleetkeeper::domain;
using infrastructure::TimeFormat;

namespace {

std::string FormatCoordinate(double latitude, double longitude) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f, %.6f", latitude, longitude);
    return buf;
}

void PrintBoat(std::ostream& out, const Boat& boat) {
    out << "Boat " << boat.getId() << ": " << boat.getName() << "\n"
        << "  Home Port: " << boat.getHomePort() << "\n"
        << "  Flag: " << boat.getFlag() << "\n";
    if (boat.getLaunchDate()) {
        out << "  Launch Date: " << boat.getLaunchDate()->toString() << "\n";
    }

    const VesselProfile& profile = boat.getProfile();
    out << "  Class: " << VesselClassToString(profile.vesselClass);
    if (profile.vesselClass == VesselClass::Cargo) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), " (capacity %.2f tons)", profile.cargoCapacity);
        out << buf;
    } else if (profile.vesselClass == VesselClass::Military) {
        out << " (weapons " << profile.weaponCount
            << ", authorised " << (profile.governmentAuthorised ? "yes" : "no") << ")";
    }
    out << "\n";

    auto current = boat.currentPosition();
    if (current) {
        out << "  Current Position: " << FormatCoordinate(current->latitude, current->longitude)
            << " at " << TimeFormat::FormatIso8601(current->timestamp) << "\n";
    } else {
        out << "  Current Position: Unknown\n";
    }
    out << "  Positions: " << boat.getPositions().size()
        << ", Arrivals: " << boat.getArrivalLogs().size() << "\n";
}

void PrintBoats(std::ostream& out, const std::vector<Boat>& boats, const std::string& emptyMessage) {
    if (boats.empty()) {
        out << emptyMessage << "\n";
        return;
    }
    for (size_t i = 0; i < boats.size(); ++i) {
        if (i > 0) out << "\n";
        PrintBoat(out, boats[i]);
    }
}

std::optional<Timestamp> ParseAt(const ParsedCommand& cmd) {
    auto at = cmd.option("at");
    if (!at) return std::nullopt;
    auto ts = TimeFormat::ParseIso8601(*at);
    if (!ts) {
        throw UsageError("--at must be an ISO-8601 timestamp, got '" + *at + "'");
    }
    return ts;
}

std::optional<LaunchDate> ParseLaunch(const ParsedCommand& cmd) {
    auto launch = cmd.option("launch");
    if (!launch) return std::nullopt;
    return LaunchDate::Parse(*launch);
}

// Builds a profile from --class/--cargo/--weapons/--authorised; nullopt if none given.
std::optional<VesselProfile> ParseProfile(const ParsedCommand& cmd) {
    if (!cmd.has("class") && !cmd.has("cargo") && !cmd.has("weapons") && !cmd.hasSwitch("authorised")) {
        return std::nullopt;
    }

    std::string className = cmd.option("class").value_or("");
    if (className.empty()) {
        className = cmd.has("cargo") ? "cargo" : (cmd.has("weapons") || cmd.hasSwitch("authorised")) ? "military" : "standard";
    }
    auto vesselClass = VesselClassFromString(className);
    if (!vesselClass) {
        throw UsageError("Unknown vessel class: " + className);
    }

    switch (*vesselClass) {
        case VesselClass::Cargo:
            return VesselProfile::Cargo(CommandLine::ParseDouble(cmd.option("cargo").value_or("0"), "--cargo"));
        case VesselClass::Military:
            return VesselProfile::Military(CommandLine::ParseInt(cmd.option("weapons").value_or("0"), "--weapons"),
                                           cmd.hasSwitch("authorised"));
        case VesselClass::Standard:
        default:
            return VesselProfile::Standard();
    }
}

} // namespace

FleetKeeperApp::FleetKeeperApp(std::shared_ptr<const Clock> clock)
    : m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = std::make_shared<SystemClock>();
    }
}

int FleetKeeperApp::Run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Run(args, std::cout, std::cerr);
}

int FleetKeeperApp::Run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    ParsedCommand cmd;
    try {
        cmd = CommandLine::Parse(args);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n\n" << CommandLine::Usage();
        return 2;
    }

    if (cmd.hasSwitch("help") || cmd.command == "help") {
        out << CommandLine::Usage();
        return 0;
    }

    if (!CommandLine::IsKnownCommand(cmd.command)) {
        err << "Error: Unknown command: " << cmd.command << "\n\n" << CommandLine::Usage();
        return 2;
    }

    try {
        Init(cmd, out);
        Execute(cmd, out);
        if (CommandLine::IsMutating(cmd.command)) {
            m_services.registry->save(m_dataFile);
            out << "Fleet data saved to " << m_dataFile << "\n";
        }
        return 0;
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n\n" << CommandLine::Usage();
        return 2;
    } catch (const SchemaError& e) {
        err << "Error loading fleet data: " << e.what() << "\n";
        return 1;
    } catch (const PersistenceError& e) {
        err << "Error accessing fleet data: " << e.what() << "\n";
        return 1;
    } catch (const FleetError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

void FleetKeeperApp::Init(const ParsedCommand& cmd, std::ostream& out) {
    std::string root = cmd.option("root").value_or(fs::current_path().string());

    m_config = infrastructure::ConfigLoader::Load(root);
    if (auto data = cmd.option("data")) {
        m_config.dataFile = *data;
    }
    if (cmd.hasSwitch("verbose")) {
        m_config.verbose = true;
    }
    m_dataFile = infrastructure::ConfigLoader::ResolveDataFile(root, m_config);

    m_services.clock = m_clock;
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.fleetStore = std::make_shared<infrastructure::FleetFileStore>(m_services.persistenceService, m_config.jsonIndent);
    m_services.registry = std::make_unique<application::FleetRegistry>(m_services.fleetStore, m_services.clock);
    m_services.registry->setVerbose(m_config.verbose);

    bool loaded = m_services.registry->loadOrInitialize(m_dataFile);
    if (m_config.verbose) {
        out << "[FleetKeeperApp] " << (loaded ? "Loaded " : "Initialized empty fleet for ") << m_dataFile << "\n";
    }
}

void FleetKeeperApp::Execute(const ParsedCommand& cmd, std::ostream& out) {
    application::FleetRegistry& registry = *m_services.registry;
    const std::string& name = cmd.command;

    if (name == "add") {
        Boat boat = registry.addBoat(cmd.arg(0, "id"), cmd.arg(1, "name"), cmd.arg(2, "home_port"), cmd.arg(3, "flag"),
                                     ParseLaunch(cmd), ParseProfile(cmd).value_or(VesselProfile::Standard()));
        out << boat.getName() << " successfully added to fleet\n";
    } else if (name == "update") {
        BoatUpdate update;
        update.name = cmd.option("name");
        update.homePort = cmd.option("port");
        update.flag = cmd.option("flag");
        update.launchDate = ParseLaunch(cmd);
        update.clearLaunchDate = cmd.hasSwitch("clear-launch");
        update.profile = ParseProfile(cmd);
        Boat boat = registry.updateBoat(cmd.arg(0, "id"), update);
        out << boat.getName() << " updated\n";
    } else if (name == "remove") {
        const std::string& id = cmd.arg(0, "id");
        registry.removeBoat(id);
        out << id << " successfully removed from fleet\n";
    } else if (name == "position") {
        const std::string& id = cmd.arg(0, "id");
        double lat = CommandLine::ParseDouble(cmd.arg(1, "latitude"), "latitude");
        double lon = CommandLine::ParseDouble(cmd.arg(2, "longitude"), "longitude");
        PositionRecord record = registry.recordPosition(id, lat, lon, ParseAt(cmd));
        out << id << " position logged: " << FormatCoordinate(record.latitude, record.longitude)
            << " at " << TimeFormat::FormatIso8601(record.timestamp) << "\n";
    } else if (name == "arrival") {
        const std::string& id = cmd.arg(0, "id");
        ArrivalLogEntry entry = registry.recordArrival(id, cmd.arg(1, "port"), ParseAt(cmd), cmd.option("note").value_or(""));
        out << id << " arrival recorded at " << entry.port << "\n";
    } else if (name == "list") {
        auto boats = registry.listBoats();
        if (auto key = cmd.option("sort")) {
            boats = application::FleetRegistry::sortBoats(std::move(boats), ParseSortKey(*key));
        }
        PrintBoats(out, boats, "The fleet is empty!");
    } else if (name == "filter") {
        BoatFilter filter;
        filter.name = cmd.option("name");
        filter.homePort = cmd.option("port");
        filter.flag = cmd.option("flag");
        auto boats = registry.filterBoats(filter);
        if (auto key = cmd.option("sort")) {
            boats = application::FleetRegistry::sortBoats(std::move(boats), ParseSortKey(*key));
        }
        PrintBoats(out, boats, "No boats match the filter.");
    } else if (name == "sort") {
        SortKey key = cmd.positional.empty() ? SortKey::Name : ParseSortKey(cmd.positional[0]);
        PrintBoats(out, application::FleetRegistry::sortBoats(registry.listBoats(), key), "The fleet is empty!");
    } else if (name == "history") {
        const std::string& id = cmd.arg(0, "id");
        auto history = registry.positionHistory(id);
        if (history.empty()) {
            out << "No position logs recorded for " << id << ".\n";
        } else {
            out << "Position History for " << id << ":\n";
            for (const auto& p : history) {
                out << "  [" << TimeFormat::FormatIso8601(p.timestamp) << "] "
                    << FormatCoordinate(p.latitude, p.longitude) << "\n";
            }
        }
    } else if (name == "log") {
        const auto& log = registry.getFleetLog();
        if (log.empty()) {
            out << "No logs recorded yet.\n";
        }
        for (const auto& entry : log) {
            out << "[" << TimeFormat::FormatIso8601(entry.timestamp) << "] " << entry.message << "\n";
        }
    } else if (name == "report") {
        auto report = registry.statusReport();
        char capacity[64];
        std::snprintf(capacity, sizeof(capacity), "%.2f", report.totalCargoCapacity);
        out << "Fleet Status Report:\n"
            << "Total Boats: " << report.total << "\n"
            << "Standard Boats: " << report.standard << "\n"
            << "Cargo Boats: " << report.cargo << "\n"
            << "Military Boats: " << report.military << "\n"
            << "Total Cargo Capacity: " << capacity << " tons\n"
            << "Recorded Positions: " << report.totalPositions << "\n"
            << "Recorded Arrivals: " << report.totalArrivals << "\n";
    } else {
        throw UsageError("Unknown command: " + name);
    }
}

} // namespace fleetkeeper::app
