/**
 * @file FilePrivacyTagRepository.hpp
 * @brief Privacy tags stored as one JSON document per session.
 */

#pragma once

#include <string>
#include <memory>
#include <mutex>
#include "domain/repositories/PrivacyTagRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace quietledger::infrastructure::storage {

/**
 * @class FilePrivacyTagRepository
 * @brief Structure: <root>/privacy/tags/<session>.json plus an id index.
 *
 * The index (<root>/privacy/tag_index.json) maps tag ids to sessions so a
 * status update touches a single session file.
 */
class FilePrivacyTagRepository : public domain::PrivacyTagRepository {
public:
    FilePrivacyTagRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence);

    void insert(const std::vector<domain::PrivacyTag>& tags) override;
    std::vector<domain::PrivacyTag> findBySession(const std::string& sessionId) override;
    bool updateStatus(const std::string& tagId, domain::TagStatus status) override;
    int removeBySession(const std::string& sessionId) override;

private:
    std::string sessionPath(const std::string& sessionId) const;
    std::string indexPath() const;

    std::vector<domain::PrivacyTag> loadSession(const std::string& sessionId) const;
    void saveSession(const std::string& sessionId, const std::vector<domain::PrivacyTag>& tags);

    std::string m_storageRoot;
    std::shared_ptr<PersistenceService> m_persistence;
    std::mutex m_mutex;
};

} // namespace quietledger::infrastructure::storage
