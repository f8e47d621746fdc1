/**
 * @file PrivacyLevel.hpp
 * @brief Binary privacy classification attached to sessions and cards.
 */

#pragma once

#include <string>
#include <optional>

namespace quietledger::domain {

/**
 * @enum PrivacyLevel
 * @brief Private content never leaves the device; public content may be published.
 */
enum class PrivacyLevel {
    Private,
    Public
};

inline std::string PrivacyLevelToString(PrivacyLevel level) {
    switch (level) {
        case PrivacyLevel::Private: return "private";
        case PrivacyLevel::Public: return "public";
        default: return "public";
    }
}

inline std::optional<PrivacyLevel> PrivacyLevelFromString(const std::string& value) {
    if (value == "private") return PrivacyLevel::Private;
    if (value == "public") return PrivacyLevel::Public;
    return std::nullopt;
}

} // namespace quietledger::domain
