/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic text file I/O.
 */

#pragma once
#include <string>

namespace fleetkeeper::infrastructure {

/**
 * @class PersistenceService
 * @brief Reads whole files and overwrites them atomically (temp -> rename).
 *
 * A reader never observes a half-written target: content goes to a sibling
 * temp file which is renamed over the target only after it was fully
 * written and closed. On any failure the temp file is removed and the
 * target is left as it was.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Atomically replaces filename with content.
     * @param filename Target path; missing parent directories are created.
     * @param content The string content to write.
     * @throws domain::PersistenceError on any I/O failure.
     */
    void writeTextAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Reads the whole file.
     * @throws domain::PersistenceError if the file is missing or unreadable.
     */
    std::string readText(const std::string& filename) const;

    /** @brief True if anything exists at filename. */
    bool exists(const std::string& filename) const;

private:
    /**
     * @brief Sibling temp path unique per operation: filename.<ticks>.tmp
     */
    std::string makeTempPath(const std::string& filename);

    unsigned long m_sequence = 0;
};

} // namespace fleetkeeper::infrastructure
