/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O operations.
 */

#pragma once
#include <string>
#include <optional>
#include <atomic>

namespace quietledger::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes whole files through a temporary sibling so readers never see
 * a half-written record.
 *
 * Every failure is reported as domain::StorageError; nothing is dropped silently.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Replaces the file content atomically (temp -> rename).
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void writeAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Creates the file only if it does not exist yet (temp -> hard link).
     * @return False if the file already exists; the existing file is untouched.
     */
    bool writeExclusive(const std::string& filename, const std::string& content);

    /** @brief Reads a whole file, nullopt if it does not exist. */
    std::optional<std::string> readText(const std::string& filename) const;

    /** @brief Removes a file if present. */
    void remove(const std::string& filename);

private:
    std::string writeTemp(const std::string& filename, const std::string& content);

    std::atomic<unsigned long long> m_tempCounter{0};
};

} // namespace quietledger::infrastructure
