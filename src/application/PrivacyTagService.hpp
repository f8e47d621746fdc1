/**
 * @file PrivacyTagService.hpp
 * @brief Persists detector matches as reviewable tags per session.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "application/DetectorEngine.hpp"
#include "application/PrivacyStateStore.hpp"
#include "application/StripedLocks.hpp"
#include "domain/PrivacyTag.hpp"
#include "domain/repositories/PrivacyTagRepository.hpp"

namespace quietledger::application {

/**
 * @class PrivacyTagService
 * @brief Scans a session's transcript once and tracks the review status of each hit.
 */
class PrivacyTagService {
public:
    using IdGenerator = std::function<std::string()>;

    PrivacyTagService(std::shared_ptr<domain::PrivacyTagRepository> repository,
                      std::shared_ptr<DetectorEngine> detector,
                      std::shared_ptr<PrivacyStateStore> stateStore,
                      IdGenerator idGenerator);

    /**
     * @brief Creates tags from a full scan unless the session already has tags.
     * Concurrent scans of one session create the tags once.
     * @return Number of tags created (0 when the session was scanned before).
     */
    int scanSession(const std::string& sessionId, const std::string& transcript);

    std::vector<domain::PrivacyTag> getTags(const std::string& sessionId);

    /** @throws domain::StorageError if the tag does not exist. */
    void updateTagStatus(const std::string& tagId, domain::TagStatus status);

    int unreviewedCount(const std::string& sessionId);

    /** @brief Drops the session's tags. Part of session deletion. */
    int deleteSession(const std::string& sessionId);

    /** @brief Session is public and every detected span has been reviewed. */
    bool canPublish(const std::string& sessionId);

private:
    std::shared_ptr<domain::PrivacyTagRepository> m_repository;
    std::shared_ptr<DetectorEngine> m_detector;
    std::shared_ptr<PrivacyStateStore> m_stateStore;
    IdGenerator m_idGenerator;

    // Check-then-insert in scanSession and removal in deleteSession.
    StripedLocks m_sessionLocks;
};

} // namespace quietledger::application
