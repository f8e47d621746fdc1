/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the ledger configuration (settings.json).
 *
 * Provides a unified way to access storage, classifier, vault and detector
 * settings without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <vector>
#include <utility>

namespace quietledger::infrastructure {

struct ClassifierSettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:3b";
    int timeoutMs = 60000;
};

struct LedgerConfig {
    std::string storageRoot;                 ///< Empty means PathUtils::GetDefaultStorageRoot().
    ClassifierSettings classifier;
    int pbkdf2Iterations = 100000;
    std::string mergePolicy = "first_by_start"; ///< "first_by_start" or "merge_overlapping".
    std::vector<std::pair<std::string, std::string>> extraPatterns;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     * @param projectRoot Directory holding settings.json.
     * @return Defaults for anything missing; defaults entirely if the file is absent or malformed.
     */
    static LedgerConfig Load(const std::string& projectRoot);

    /**
     * @brief Writes the configuration to settings.json, preserving unknown keys if possible.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& projectRoot, const LedgerConfig& config);
};

} // namespace quietledger::infrastructure
