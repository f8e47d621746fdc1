/**
 * @file PrivacyStateStore.cpp
 * @brief Implementation of PrivacyStateStore.
 */

#include "application/PrivacyStateStore.hpp"
#include <iostream>
#include <stdexcept>

namespace quietledger::application {

using domain::PrivacyLevel;

PrivacyStateStore::PrivacyStateStore(std::shared_ptr<domain::PrivacySettingsRepository> repository,
                                     std::shared_ptr<domain::PasswordHasher> hasher)
    : m_repository(std::move(repository)), m_hasher(std::move(hasher)) {
    if (!m_repository || !m_hasher) {
        throw std::invalid_argument("PrivacyStateStore requires a repository and a hasher.");
    }
}

void PrivacyStateStore::setLevel(const std::string& entityId, PrivacyLevel level) {
    if (entityId.empty()) {
        throw std::invalid_argument("PrivacyStateStore: entityId cannot be empty.");
    }
    m_repository->setLevel(entityId, level);
}

void PrivacyStateStore::setLevel(const std::vector<std::string>& entityIds, PrivacyLevel level) {
    for (const auto& id : entityIds) {
        setLevel(id, level);
    }
}

PrivacyLevel PrivacyStateStore::getLevel(const std::string& entityId) const {
    return m_repository->getLevel(entityId).value_or(PrivacyLevel::Public);
}

bool PrivacyStateStore::canUseExternalAPI(const std::string& entityId) const {
    return getLevel(entityId) == PrivacyLevel::Public;
}

bool PrivacyStateStore::canUseExternalAPI(const std::vector<std::string>& entityIds) const {
    for (const auto& id : entityIds) {
        if (!canUseExternalAPI(id)) return false;
    }
    return true;
}

bool PrivacyStateStore::canPublish(const std::string& entityId) const {
    return getLevel(entityId) == PrivacyLevel::Public;
}

std::vector<std::string> PrivacyStateStore::getPrivateIds() const {
    return m_repository->listPrivate();
}

size_t PrivacyStateStore::privateCount() const {
    return m_repository->listPrivate().size();
}

bool PrivacyStateStore::unlockVault(const std::string& password) {
    auto credential = m_repository->getCredential();
    if (!credential) {
        m_vaultUnlocked = true;
        return true;
    }

    if (m_hasher->verify(password, *credential)) {
        m_vaultUnlocked = true;
        return true;
    }
    std::cerr << "[PrivacyStateStore] Vault unlock rejected." << std::endl;
    return false;
}

void PrivacyStateStore::lockVault() {
    m_vaultUnlocked = false;
}

bool PrivacyStateStore::isVaultUnlocked() const {
    if (!hasVaultPassword()) return true;
    return m_vaultUnlocked.load();
}

bool PrivacyStateStore::hasVaultPassword() const {
    return m_repository->getCredential().has_value();
}

bool PrivacyStateStore::setPassword(const std::string& password) {
    if (password.empty()) {
        return false;
    }
    m_repository->setCredential(m_hasher->derive(password));
    m_vaultUnlocked = true;
    std::cout << "[PrivacyStateStore] Vault password updated." << std::endl;
    return true;
}

PublishReadiness PrivacyStateStore::checkPublishReady(const std::string& sessionId,
                                                      const std::vector<std::string>& cardIds) const {
    PublishReadiness result;

    if (getLevel(sessionId) == PrivacyLevel::Private) {
        result.blockers.push_back("Session is marked as private");
    }

    int privateCards = 0;
    for (const auto& cardId : cardIds) {
        if (getLevel(cardId) == PrivacyLevel::Private) {
            ++privateCards;
        }
    }
    if (privateCards > 0) {
        result.blockers.push_back(std::to_string(privateCards) + " card(s) marked as private");
    }

    // Private status cannot be verified while the vault is locked.
    if (hasVaultPassword() && !m_vaultUnlocked.load()) {
        result.blockers.push_back("Vault is locked - unlock to verify private content");
    }

    result.ready = result.blockers.empty();
    return result;
}

} // namespace quietledger::application
