/**
 * @file FilePrivacySettingsRepository.hpp
 * @brief Privacy levels as one small file per entity.
 */

#pragma once

#include <string>
#include <memory>
#include "domain/repositories/PrivacySettingsRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace quietledger::infrastructure::storage {

/**
 * @class FilePrivacySettingsRepository
 * @brief Structure: <root>/privacy/levels/<entity>, <root>/privacy/vault.json.
 *
 * Each level file holds "private" or "public". Levels are independent files,
 * so concurrent writes for different entities never contend.
 */
class FilePrivacySettingsRepository : public domain::PrivacySettingsRepository {
public:
    FilePrivacySettingsRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence);

    std::optional<domain::PrivacyLevel> getLevel(const std::string& entityId) override;
    void setLevel(const std::string& entityId, domain::PrivacyLevel level) override;
    std::vector<std::string> listPrivate() override;
    std::optional<domain::VaultCredential> getCredential() override;
    void setCredential(const domain::VaultCredential& credential) override;

private:
    std::string levelDirectory() const;
    std::string levelPath(const std::string& entityId) const;
    std::string vaultPath() const;

    // Unknown content is read as private.
    domain::PrivacyLevel parseLevel(const std::string& entityId, const std::string& text) const;

    std::string m_storageRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace quietledger::infrastructure::storage
