/**
 * @file PrivacyStateStore.hpp
 * @brief Privacy levels, vault lock state and the publish gate.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include "domain/PrivacyLevel.hpp"
#include "domain/VaultCredential.hpp"
#include "domain/repositories/PrivacySettingsRepository.hpp"

namespace quietledger::application {

/**
 * @struct PublishReadiness
 * @brief Result of the publish gate. ready is true iff blockers is empty.
 */
struct PublishReadiness {
    bool ready = true;
    std::vector<std::string> blockers;
};

/**
 * @class PrivacyStateStore
 * @brief Gatekeeper for external API use and publishing.
 *
 * Constructed explicitly per process. The vault starts locked whenever a
 * password exists; without a password it is permanently unlocked.
 * Unlock attempts are not throttled.
 */
class PrivacyStateStore {
public:
    PrivacyStateStore(std::shared_ptr<domain::PrivacySettingsRepository> repository,
                      std::shared_ptr<domain::PasswordHasher> hasher);

    // --- Levels ---

    /** @throws domain::StorageError */
    void setLevel(const std::string& entityId, domain::PrivacyLevel level);
    void setLevel(const std::vector<std::string>& entityIds, domain::PrivacyLevel level);

    /** @brief Stored level, public when never set. */
    domain::PrivacyLevel getLevel(const std::string& entityId) const;

    bool canUseExternalAPI(const std::string& entityId) const;

    /** @brief True only if every entity is public. */
    bool canUseExternalAPI(const std::vector<std::string>& entityIds) const;

    bool canPublish(const std::string& entityId) const;

    std::vector<std::string> getPrivateIds() const;
    size_t privateCount() const;

    // --- Vault ---

    /** @brief True on first run (no password) or when the password matches. */
    bool unlockVault(const std::string& password);
    void lockVault();
    bool isVaultUnlocked() const;
    bool hasVaultPassword() const;

    /** @brief Stores a new password and unlocks. False for an empty password. */
    bool setPassword(const std::string& password);

    // --- Publish gate ---

    /**
     * @brief Read-only check of the session, its cards and the vault.
     * @param sessionId Session to publish.
     * @param cardIds Cards belonging to that session.
     */
    PublishReadiness checkPublishReady(const std::string& sessionId, const std::vector<std::string>& cardIds) const;

private:
    std::shared_ptr<domain::PrivacySettingsRepository> m_repository;
    std::shared_ptr<domain::PasswordHasher> m_hasher;
    std::atomic<bool> m_vaultUnlocked{false};
};

} // namespace quietledger::application
