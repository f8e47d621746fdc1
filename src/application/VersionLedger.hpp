/**
 * @file VersionLedger.hpp
 * @brief Append-only per-document history of full-content saves.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include "application/StripedLocks.hpp"
#include "domain/DocumentVersion.hpp"
#include "domain/repositories/VersionRepository.hpp"

namespace quietledger::application {

/**
 * @class VersionLedger
 * @brief Allocates version numbers and restores old content as new versions.
 *
 * Allocation and append are serialized per document; saves to different
 * documents proceed in parallel. History is never rewritten.
 */
class VersionLedger {
public:
    explicit VersionLedger(std::shared_ptr<domain::VersionRepository> repository);

    /**
     * @brief Appends a new version and refreshes the current-content projection.
     * @return The allocated version number (max existing + 1, starting at 1).
     * @throws domain::StorageError if the version could not be persisted. A failed
     * projection refresh is logged only; the version is already saved.
     */
    int saveVersion(const std::string& documentId, const std::string& content, const std::string& versionType);

    /** @brief All versions, most recent first. */
    std::vector<domain::DocumentVersion> getVersions(const std::string& documentId);

    std::optional<domain::DocumentVersion> getLatestVersion(const std::string& documentId);

    /** @brief Number the next save will receive. 1 for a document without history. */
    int getNextVersionNumber(const std::string& documentId);

    /**
     * @brief Re-saves the content of an old version as a new "restored" version.
     * @throws domain::VersionNotFound if the version does not exist.
     */
    domain::DocumentVersion restore(const std::string& documentId, int versionNumber);

    /**
     * @brief Content of the latest version.
     * Served from the projection; a projection behind the history is rebuilt first.
     */
    std::optional<std::string> getCurrentContent(const std::string& documentId);

private:
    domain::DocumentVersion appendLocked(const std::string& documentId, const std::string& content, const std::string& versionType);

    std::shared_ptr<domain::VersionRepository> m_repository;

    StripedLocks m_documentLocks;
};

} // namespace quietledger::application
