/**
 * @file PrivacySettingsRepository.hpp
 * @brief Storage interface for privacy levels and the vault credential.
 */

#pragma once

#include <vector>
#include <string>
#include <optional>
#include "domain/PrivacyLevel.hpp"
#include "domain/VaultCredential.hpp"

namespace quietledger::domain {

/**
 * @class PrivacySettingsRepository
 * @brief Per-entity levels plus the single vault credential.
 *
 * Writing one entity's level must not serialize with writes to other entities.
 */
class PrivacySettingsRepository {
public:
    virtual ~PrivacySettingsRepository() = default;

    virtual std::optional<PrivacyLevel> getLevel(const std::string& entityId) = 0;
    virtual void setLevel(const std::string& entityId, PrivacyLevel level) = 0;

    /** @brief Entity ids whose stored level is private. */
    virtual std::vector<std::string> listPrivate() = 0;

    virtual std::optional<VaultCredential> getCredential() = 0;
    virtual void setCredential(const VaultCredential& credential) = 0;
};

} // namespace quietledger::domain
