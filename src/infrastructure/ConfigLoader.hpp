/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 *
 * Provides a unified way to access configuration like the fleet data file
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>

namespace fleetkeeper::infrastructure {

/**
 * @struct FleetConfig
 * @brief Settings recognised in settings.json.
 */
struct FleetConfig {
    std::string dataFile = "fleet_data.json";  ///< Relative paths resolve against the project root.
    bool verbose = false;                       ///< Informational log lines on stdout.
    int jsonIndent = 2;                         ///< Pretty-print width of the data file.
};

class ConfigLoader {
public:
    static constexpr const char* kSettingsFile = "settings.json";
    static constexpr const char* kDataFileEnv = "FLEETKEEPER_DATA_FILE";

    /**
     * @brief Reads settings.json under projectRoot, then applies environment overrides.
     * Missing or malformed files yield defaults (malformed ones with a warning).
     */
    static FleetConfig Load(const std::string& projectRoot);

    /**
     * @brief Writes the config to settings.json, preserving unknown keys if possible.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& projectRoot, const FleetConfig& config);

    /**
     * @brief Absolute-or-root-relative path of the data file.
     */
    static std::string ResolveDataFile(const std::string& projectRoot, const FleetConfig& config);
};

} // namespace fleetkeeper::infrastructure
