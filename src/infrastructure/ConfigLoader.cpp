/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace fleetkeeper::infrastructure {

namespace fs = std::filesystem;

FleetConfig ConfigLoader::Load(const std::string& projectRoot) {
    FleetConfig config;
    fs::path configPath = fs::path(projectRoot) / kSettingsFile;

    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            if (j.contains("data_file") && j["data_file"].is_string()) {
                config.dataFile = j["data_file"].get<std::string>();
            }
            if (j.contains("verbose") && j["verbose"].is_boolean()) {
                config.verbose = j["verbose"].get<bool>();
            }
            if (j.contains("json_indent") && j["json_indent"].is_number_integer()) {
                config.jsonIndent = j["json_indent"].get<int>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
            config = FleetConfig{};
        }
    }

    const char* envDataFile = std::getenv(kDataFileEnv);
    if (envDataFile && *envDataFile) {
        config.dataFile = envDataFile;
    }

    return config;
}

bool ConfigLoader::Save(const std::string& projectRoot, const FleetConfig& config) {
    fs::path configPath = fs::path(projectRoot) / kSettingsFile;
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    std::error_code ec;
    if (fs::exists(configPath, ec)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json existing;
            f >> existing;
            if (existing.is_object()) j = std::move(existing);
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
        }
    }

    j["data_file"] = config.dataFile;
    j["verbose"] = config.verbose;
    j["json_indent"] = config.jsonIndent;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    if (f.fail()) {
        std::cerr << "[ConfigLoader] Error writing settings.json" << std::endl;
        return false;
    }
    return true;
}

std::string ConfigLoader::ResolveDataFile(const std::string& projectRoot, const FleetConfig& config) {
    fs::path dataPath(config.dataFile);
    if (dataPath.is_absolute() || projectRoot.empty()) {
        return dataPath.string();
    }
    return (fs::path(projectRoot) / dataPath).string();
}

} // namespace fleetkeeper::infrastructure
