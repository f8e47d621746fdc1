/**
 * @file DocumentVersion.hpp
 * @brief Immutable entry of the per-document version ledger.
 */

#pragma once

#include <string>
#include <chrono>

namespace quietledger::domain {

/// Version types produced by the application. Other strings are stored verbatim.
namespace version_type {
inline const std::string Raw = "raw";
inline const std::string Edited = "edited";
inline const std::string Polished = "polished";
inline const std::string Restored = "restored";
} // namespace version_type

/**
 * @struct DocumentVersion
 * @brief Full content of a document at one save.
 *
 * Invariant: versionNumber >= 1, unique per documentId, never updated or deleted.
 */
struct DocumentVersion {
    std::string documentId;
    int versionNumber = 0;
    std::string versionType;
    std::string content;
    std::chrono::system_clock::time_point createdAt;

    /// Stable identifier derived from the ledger key.
    std::string id() const {
        return documentId + "-v" + std::to_string(versionNumber);
    }
};

/// Denormalized latest content, tagged with the version it was copied from.
struct CurrentContent {
    int versionNumber = 0;
    std::string content;
};

} // namespace quietledger::domain
