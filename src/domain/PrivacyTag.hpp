/**
 * @file PrivacyTag.hpp
 * @brief Persisted, reviewable record of a detected span tied to a session.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace quietledger::domain {

enum class TagStatus {
    Unreviewed,
    Accepted,
    Dismissed
};

inline std::string TagStatusToString(TagStatus status) {
    switch (status) {
        case TagStatus::Unreviewed: return "unreviewed";
        case TagStatus::Accepted: return "accepted";
        case TagStatus::Dismissed: return "dismissed";
        default: return "unreviewed";
    }
}

inline std::optional<TagStatus> TagStatusFromString(const std::string& value) {
    if (value == "unreviewed") return TagStatus::Unreviewed;
    if (value == "accepted") return TagStatus::Accepted;
    if (value == "dismissed") return TagStatus::Dismissed;
    return std::nullopt;
}

/**
 * @struct PrivacyTag
 * @brief Created by the first scan of a session; only the status ever changes.
 */
struct PrivacyTag {
    std::string id;
    std::string sessionId;
    int startOffset = 0;
    int endOffset = 0;
    TagStatus status = TagStatus::Unreviewed;
    std::string tagType; ///< Category of the originating match.
    std::chrono::system_clock::time_point createdAt;
};

} // namespace quietledger::domain
