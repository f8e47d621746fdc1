#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "application/PrivacyStateStore.hpp"
#include "infrastructure/Pbkdf2PasswordHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/storage/FilePrivacySettingsRepository.hpp"

using namespace quietledger;
using domain::PrivacyLevel;

namespace {

std::unique_ptr<application::PrivacyStateStore> OpenStore(const std::string& root) {
    return std::make_unique<application::PrivacyStateStore>(
        std::make_shared<infrastructure::storage::FilePrivacySettingsRepository>(
            root, std::make_shared<infrastructure::PersistenceService>()),
        std::make_shared<infrastructure::Pbkdf2PasswordHasher>(1000));
}

void TestLevels(const std::string& root) {
    auto store = OpenStore(root);

    // Unknown entities are public
    assert(store->getLevel("never-seen") == PrivacyLevel::Public);
    assert(store->canUseExternalAPI("never-seen"));
    assert(store->canPublish("never-seen"));

    store->setLevel("session-1", PrivacyLevel::Private);
    assert(store->getLevel("session-1") == PrivacyLevel::Private);
    assert(!store->canUseExternalAPI("session-1"));
    assert(!store->canPublish("session-1"));

    store->setLevel("session-1", PrivacyLevel::Public);
    assert(store->canUseExternalAPI("session-1"));

    store->setLevel(std::vector<std::string>{"card-b", "card-a", "card/c"}, PrivacyLevel::Private);
    assert(!store->canUseExternalAPI(std::vector<std::string>{"session-1", "card-a"}));
    assert(store->canUseExternalAPI(std::vector<std::string>{"session-1", "never-seen"}));

    auto ids = store->getPrivateIds();
    assert(ids.size() == 3);
    assert(ids[0] == "card-a");
    assert(ids[1] == "card-b");
    assert(ids[2] == "card/c");
    assert(store->privateCount() == 3);

    bool threw = false;
    try {
        store->setLevel("", PrivacyLevel::Private);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Another instance sees the same levels
    auto reopened = OpenStore(root);
    assert(reopened->getLevel("card-b") == PrivacyLevel::Private);
    assert(reopened->privateCount() == 3);
    std::cout << "[PASS] Levels default to public and persist." << std::endl;
}

void TestVault(const std::string& root) {
    auto store = OpenStore(root);

    // First run: no password, vault open
    assert(!store->hasVaultPassword());
    assert(store->isVaultUnlocked());
    assert(store->unlockVault("anything"));

    assert(!store->setPassword(""));
    assert(!store->hasVaultPassword());

    assert(store->setPassword("hunter2"));
    assert(store->hasVaultPassword());
    assert(store->isVaultUnlocked());

    // A new process starts locked
    auto reopened = OpenStore(root);
    assert(reopened->hasVaultPassword());
    assert(!reopened->isVaultUnlocked());
    assert(!reopened->unlockVault("hunter3"));
    assert(!reopened->isVaultUnlocked());
    assert(reopened->unlockVault("hunter2"));
    assert(reopened->isVaultUnlocked());
    reopened->lockVault();
    assert(!reopened->isVaultUnlocked());
    std::cout << "[PASS] Vault password set, verified and locked." << std::endl;
}

void TestHasher() {
    infrastructure::Pbkdf2PasswordHasher hasher(1000);
    auto a = hasher.derive("correct horse");
    auto b = hasher.derive("correct horse");

    assert(a.iterations == 1000);
    assert(a.saltHex.size() == 2 * infrastructure::Pbkdf2PasswordHasher::kSaltLength);
    assert(a.hashHex.size() == 2 * infrastructure::Pbkdf2PasswordHasher::kKeyLength);
    assert(a.hashHex.find("correct") == std::string::npos);
    assert(a.saltHex != b.saltHex);
    assert(a.hashHex != b.hashHex);

    assert(hasher.verify("correct horse", a));
    assert(hasher.verify("correct horse", b));
    assert(!hasher.verify("correct horse ", a));

    domain::VaultCredential broken{"zz", "not-hex", 1000};
    assert(!hasher.verify("correct horse", broken));
    std::cout << "[PASS] PBKDF2 credentials are salted and verifiable." << std::endl;
}

void TestPublishReadiness(const std::string& root) {
    auto store = OpenStore(root);

    auto clean = store->checkPublishReady("session-ok", {"card-x"});
    assert(clean.ready);
    assert(clean.blockers.empty());

    store->setLevel("session-hidden", PrivacyLevel::Private);
    store->setLevel("card-y", PrivacyLevel::Private);
    store->setLevel("card-z", PrivacyLevel::Private);
    store->setPassword("pw");
    store->lockVault();

    auto blocked = store->checkPublishReady("session-hidden", {"card-x", "card-y", "card-z"});
    assert(!blocked.ready);
    assert(blocked.blockers.size() == 3);
    assert(blocked.blockers[0] == "Session is marked as private");
    assert(blocked.blockers[1] == "2 card(s) marked as private");
    assert(blocked.blockers[2] == "Vault is locked - unlock to verify private content");

    assert(store->unlockVault("pw"));
    assert(store->checkPublishReady("session-hidden", {}).blockers.size() == 1);
    std::cout << "[PASS] Publish readiness lists every blocker." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PrivacyStateStore Test..." << std::endl;

    std::string testRoot = "test_project_root_privacy";
    std::filesystem::remove_all(testRoot);

    TestLevels(testRoot + "/levels");
    TestVault(testRoot + "/vault");
    TestHasher();
    TestPublishReadiness(testRoot + "/publish");

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
