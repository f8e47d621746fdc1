#include "application/PrivacyTagService.hpp"
#include "domain/PrivacyErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace quietledger::application {

using domain::PrivacyTag;
using domain::TagStatus;

PrivacyTagService::PrivacyTagService(std::shared_ptr<domain::PrivacyTagRepository> repository,
                                     std::shared_ptr<DetectorEngine> detector,
                                     std::shared_ptr<PrivacyStateStore> stateStore,
                                     IdGenerator idGenerator)
    : m_repository(std::move(repository)),
      m_detector(std::move(detector)),
      m_stateStore(std::move(stateStore)),
      m_idGenerator(std::move(idGenerator)) {
    if (!m_repository || !m_detector || !m_stateStore || !m_idGenerator) {
        throw std::invalid_argument("PrivacyTagService: missing collaborator.");
    }
}

int PrivacyTagService::scanSession(const std::string& sessionId, const std::string& transcript) {
    if (transcript.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(m_sessionLocks.forKey(sessionId));

    auto existing = m_repository->findBySession(sessionId);
    if (!existing.empty()) {
        return 0;
    }

    auto matches = m_detector->fullScan(transcript);
    if (matches.empty()) {
        return 0;
    }

    const auto now = std::chrono::system_clock::now();
    std::vector<PrivacyTag> tags;
    tags.reserve(matches.size());
    for (const auto& match : matches) {
        PrivacyTag tag;
        tag.id = m_idGenerator();
        tag.sessionId = sessionId;
        tag.startOffset = match.startOffset;
        tag.endOffset = match.endOffset;
        tag.status = TagStatus::Unreviewed;
        tag.tagType = match.category;
        tag.createdAt = now;
        tags.push_back(std::move(tag));
    }

    m_repository->insert(tags);
    std::cout << "[PrivacyTagService] Found " << tags.size() << " sensitive span(s) in session " << sessionId << std::endl;
    return static_cast<int>(tags.size());
}

std::vector<PrivacyTag> PrivacyTagService::getTags(const std::string& sessionId) {
    auto tags = m_repository->findBySession(sessionId);
    std::stable_sort(tags.begin(), tags.end(), [](const PrivacyTag& a, const PrivacyTag& b) {
        return a.startOffset < b.startOffset;
    });
    return tags;
}

void PrivacyTagService::updateTagStatus(const std::string& tagId, TagStatus status) {
    if (!m_repository->updateStatus(tagId, status)) {
        throw domain::StorageError("Privacy tag not found: " + tagId);
    }
}

int PrivacyTagService::unreviewedCount(const std::string& sessionId) {
    auto tags = m_repository->findBySession(sessionId);
    return static_cast<int>(std::count_if(tags.begin(), tags.end(), [](const PrivacyTag& t) {
        return t.status == TagStatus::Unreviewed;
    }));
}

int PrivacyTagService::deleteSession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_sessionLocks.forKey(sessionId));
    return m_repository->removeBySession(sessionId);
}

bool PrivacyTagService::canPublish(const std::string& sessionId) {
    return m_stateStore->canPublish(sessionId) && unreviewedCount(sessionId) == 0;
}

} // namespace quietledger::application
