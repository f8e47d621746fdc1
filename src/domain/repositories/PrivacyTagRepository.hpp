/**
 * @file PrivacyTagRepository.hpp
 * @brief Storage interface for privacy tags.
 */

#pragma once

#include <vector>
#include <string>
#include "domain/PrivacyTag.hpp"

namespace quietledger::domain {

class PrivacyTagRepository {
public:
    virtual ~PrivacyTagRepository() = default;

    virtual void insert(const std::vector<PrivacyTag>& tags) = 0;

    virtual std::vector<PrivacyTag> findBySession(const std::string& sessionId) = 0;

    /** @brief Returns false if no tag has this id. */
    virtual bool updateStatus(const std::string& tagId, TagStatus status) = 0;

    /** @brief Removes every tag of a session. Returns the number removed. */
    virtual int removeBySession(const std::string& sessionId) = 0;
};

} // namespace quietledger::domain
