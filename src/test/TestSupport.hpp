/**
 * @file TestSupport.hpp
 * @brief Shared fakes for the test executables.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

#include "domain/Clock.hpp"
#include "domain/FleetErrors.hpp"
#include "domain/IFleetStore.hpp"

namespace fleetkeeper::test {

/**
 * @brief Clock that only moves when told to.
 */
class ManualClock : public domain::Clock {
public:
    explicit ManualClock(domain::Timestamp start = FromEpochSeconds(1700000000)) : m_now(start) {}

    domain::Timestamp now() const override { return m_now; }

    void advance(std::chrono::milliseconds delta) { m_now += delta; }
    void set(domain::Timestamp ts) { m_now = ts; }

    static domain::Timestamp FromEpochSeconds(long long secs) {
        return domain::Timestamp(std::chrono::seconds(secs));
    }

private:
    domain::Timestamp m_now;
};

/**
 * @brief In-memory IFleetStore keyed by path. Can be told to fail.
 */
class MemoryFleetStore : public domain::IFleetStore {
public:
    void save(const std::string& path, const domain::FleetSnapshot& snapshot) override {
        ++saveCalls;
        if (failSaves) throw domain::PersistenceError("injected save failure");
        documents[path] = snapshot;
    }

    domain::FleetSnapshot load(const std::string& path) override {
        ++loadCalls;
        auto it = documents.find(path);
        if (it == documents.end()) throw domain::PersistenceError("File not found: " + path);
        return it->second;
    }

    bool exists(const std::string& path) const override {
        return documents.count(path) != 0;
    }

    std::map<std::string, domain::FleetSnapshot> documents;
    bool failSaves = false;
    int saveCalls = 0;
    int loadCalls = 0;
};

/**
 * @brief Fresh directory under the working directory, removed on scope exit.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& name) : m_path(std::filesystem::current_path() / name) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

/**
 * @brief Runs fn and reports whether it threw exactly an E (or subclass).
 */
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
    return false;
}

} // namespace fleetkeeper::test
