/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include "domain/FleetErrors.hpp"

namespace fleetkeeper::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Could not remove temp file " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

std::string PersistenceService::makeTempPath(const std::string& filename) {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return filename + "." + std::to_string(ticks) + "-" + std::to_string(++m_sequence) + ".tmp";
}

void PersistenceService::writeTextAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;
    fs::path tempPath = makeTempPath(filename);

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            throw domain::PersistenceError("Cannot create directory for " + filename + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            throw domain::PersistenceError("Cannot open temporary file next to " + filename);
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            RemoveQuietly(tempPath);
            throw domain::PersistenceError("Write failed for " + filename);
        }
        ofs.close();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Close failed: " << tempPath << std::endl;
            RemoveQuietly(tempPath);
            throw domain::PersistenceError("Write failed for " + filename);
        }
    }

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        RemoveQuietly(tempPath);
        throw domain::PersistenceError("Cannot replace " + filename + ": " + ec.message());
    }
}

std::string PersistenceService::readText(const std::string& filename) const {
    std::error_code ec;
    if (!fs::is_regular_file(filename, ec)) {
        throw domain::PersistenceError("File not found: " + filename);
    }

    std::ifstream ifs(filename, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        throw domain::PersistenceError("Cannot open " + filename);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw domain::PersistenceError("Read failed for " + filename);
    }
    return buffer.str();
}

bool PersistenceService::exists(const std::string& filename) const {
    std::error_code ec;
    return fs::exists(filename, ec);
}

} // namespace fleetkeeper::infrastructure
