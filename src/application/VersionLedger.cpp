/**
 * @file VersionLedger.cpp
 * @brief Implementation of VersionLedger.
 */

#include "application/VersionLedger.hpp"
#include "domain/PrivacyErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace quietledger::application {

using domain::DocumentVersion;

VersionLedger::VersionLedger(std::shared_ptr<domain::VersionRepository> repository)
    : m_repository(std::move(repository)) {
    if (!m_repository) {
        throw std::invalid_argument("VersionLedger requires a repository.");
    }
}

DocumentVersion VersionLedger::appendLocked(const std::string& documentId,
                                            const std::string& content,
                                            const std::string& versionType) {
    DocumentVersion version;
    version.documentId = documentId;
    version.versionNumber = m_repository->maxVersionNumber(documentId).value_or(0) + 1;
    version.versionType = versionType;
    version.content = content;
    version.createdAt = std::chrono::system_clock::now();

    m_repository->append(version);

    // The version is durable from here; a stale projection is repaired on read.
    try {
        m_repository->setCurrentContent(documentId, version.versionNumber, content);
    } catch (const domain::StorageError& e) {
        std::cerr << "[VersionLedger] Current content of " << documentId << " not refreshed to v"
                  << version.versionNumber << ": " << e.what() << std::endl;
    }
    return version;
}

int VersionLedger::saveVersion(const std::string& documentId, const std::string& content, const std::string& versionType) {
    if (documentId.empty()) {
        throw std::invalid_argument("VersionLedger: documentId cannot be empty.");
    }

    std::lock_guard<std::mutex> lock(m_documentLocks.forKey(documentId));
    try {
        auto version = appendLocked(documentId, content, versionType);
        std::cout << "[VersionLedger] Saved v" << version.versionNumber << " (" << versionType
                  << ") for " << documentId << std::endl;
        return version.versionNumber;
    } catch (const domain::StorageError& e) {
        std::cerr << "[VersionLedger] Failed to save version for " << documentId << ": " << e.what() << std::endl;
        throw;
    }
}

std::vector<DocumentVersion> VersionLedger::getVersions(const std::string& documentId) {
    auto versions = m_repository->findByDocument(documentId);
    std::sort(versions.begin(), versions.end(), [](const DocumentVersion& a, const DocumentVersion& b) {
        return a.versionNumber > b.versionNumber;
    });
    return versions;
}

std::optional<DocumentVersion> VersionLedger::getLatestVersion(const std::string& documentId) {
    auto versions = getVersions(documentId);
    if (versions.empty()) return std::nullopt;
    return versions.front();
}

int VersionLedger::getNextVersionNumber(const std::string& documentId) {
    return m_repository->maxVersionNumber(documentId).value_or(0) + 1;
}

DocumentVersion VersionLedger::restore(const std::string& documentId, int versionNumber) {
    if (versionNumber < 1) {
        throw domain::VersionNotFound(documentId, versionNumber);
    }

    std::lock_guard<std::mutex> lock(m_documentLocks.forKey(documentId));

    auto versions = m_repository->findByDocument(documentId);
    auto it = std::find_if(versions.begin(), versions.end(), [versionNumber](const DocumentVersion& v) {
        return v.versionNumber == versionNumber;
    });
    if (it == versions.end()) {
        std::cerr << "[VersionLedger] Restore failed: version not found (" << documentId
                  << " v" << versionNumber << ")" << std::endl;
        throw domain::VersionNotFound(documentId, versionNumber);
    }

    auto restored = appendLocked(documentId, it->content, domain::version_type::Restored);
    std::cout << "[VersionLedger] Restored v" << versionNumber << " of " << documentId
              << " as v" << restored.versionNumber << std::endl;
    return restored;
}

std::optional<std::string> VersionLedger::getCurrentContent(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_documentLocks.forKey(documentId));

    auto latestNumber = m_repository->maxVersionNumber(documentId);
    auto current = m_repository->getCurrentContent(documentId);
    if (!latestNumber) {
        return current ? std::optional<std::string>(current->content) : std::nullopt;
    }
    if (current && current->versionNumber == *latestNumber) {
        return current->content;
    }

    auto versions = m_repository->findByDocument(documentId);
    auto latest = std::find_if(versions.begin(), versions.end(), [&latestNumber](const DocumentVersion& v) {
        return v.versionNumber == *latestNumber;
    });
    if (latest == versions.end()) {
        throw domain::StorageError("Latest version of " + documentId + " is listed but unreadable.");
    }

    std::cout << "[VersionLedger] Repairing current content of " << documentId << " to v" << *latestNumber << std::endl;
    try {
        m_repository->setCurrentContent(documentId, latest->versionNumber, latest->content);
    } catch (const domain::StorageError& e) {
        std::cerr << "[VersionLedger] Repair failed, serving v" << *latestNumber << " from history: " << e.what() << std::endl;
    }
    return latest->content;
}

} // namespace quietledger::application
