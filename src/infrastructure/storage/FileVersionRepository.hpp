/**
 * @file FileVersionRepository.hpp
 * @brief File-system based append-only version log.
 */

#pragma once

#include <string>
#include <memory>
#include "domain/repositories/VersionRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace quietledger::infrastructure::storage {

/**
 * @class FileVersionRepository
 * @brief One JSON file per version.
 *
 * Structure: <root>/versions/<doc>/v000001.json, <root>/documents/<doc>.json.
 * Version files are created exclusively, so a (document, number) pair can
 * only ever be written once.
 */
class FileVersionRepository : public domain::VersionRepository {
public:
    FileVersionRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence);

    void append(const domain::DocumentVersion& version) override;
    std::vector<domain::DocumentVersion> findByDocument(const std::string& documentId) override;
    std::optional<int> maxVersionNumber(const std::string& documentId) override;
    void setCurrentContent(const std::string& documentId, int versionNumber, const std::string& content) override;
    std::optional<domain::CurrentContent> getCurrentContent(const std::string& documentId) override;

private:
    std::string versionDirectory(const std::string& documentId) const;
    std::string versionPath(const std::string& documentId, int versionNumber) const;
    std::string documentPath(const std::string& documentId) const;

    std::string m_storageRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace quietledger::infrastructure::storage
