#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/DetectorEngine.hpp"
#include "application/PrivacyStateStore.hpp"
#include "application/PrivacyTagService.hpp"
#include "domain/PrivacyErrors.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/Pbkdf2PasswordHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/storage/FilePrivacySettingsRepository.hpp"
#include "infrastructure/storage/FilePrivacyTagRepository.hpp"

using namespace quietledger;
using domain::TagStatus;

int main() {
    std::cout << "[Test] Starting PrivacyTagService Test..." << std::endl;

    std::string testRoot = "test_project_root_tags";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto detector = std::make_shared<application::DetectorEngine>();
    auto store = std::make_shared<application::PrivacyStateStore>(
        std::make_shared<infrastructure::storage::FilePrivacySettingsRepository>(testRoot, persistence),
        std::make_shared<infrastructure::Pbkdf2PasswordHasher>(1000));
    application::PrivacyTagService service(
        std::make_shared<infrastructure::storage::FilePrivacyTagRepository>(testRoot, persistence),
        detector, store, &infrastructure::GenerateId);

    const std::string sessionId = "session-42";
    const std::string transcript = "Email bob@example.com about the doctor. SSN 123-45-6789.";

    // Scan creates one unreviewed tag per finding
    assert(service.scanSession(sessionId, transcript) == 3);
    auto tags = service.getTags(sessionId);
    assert(tags.size() == 3);
    assert(tags[0].tagType == "Email");
    assert(tags[1].tagType == "Topic:Medical");
    assert(tags[2].tagType == "SSN");
    for (const auto& tag : tags) {
        assert(tag.status == TagStatus::Unreviewed);
        assert(tag.sessionId == sessionId);
        assert(!tag.id.empty());
        assert(transcript.substr(tag.startOffset, tag.endOffset - tag.startOffset).size() > 0);
    }
    assert(tags[0].id != tags[1].id);
    std::cout << "[PASS] Scan created three unreviewed tags." << std::endl;

    // A second scan changes nothing
    assert(service.scanSession(sessionId, transcript + " More bob@example.com text.") == 0);
    assert(service.getTags(sessionId).size() == 3);
    assert(service.scanSession("empty-session", "") == 0);
    assert(service.getTags("empty-session").empty());
    std::cout << "[PASS] Scanning is idempotent per session." << std::endl;

    // Publishing waits for review
    assert(store->canPublish(sessionId));
    assert(service.unreviewedCount(sessionId) == 3);
    assert(!service.canPublish(sessionId));

    service.updateTagStatus(tags[0].id, TagStatus::Accepted);
    service.updateTagStatus(tags[1].id, TagStatus::Dismissed);
    assert(service.unreviewedCount(sessionId) == 1);
    assert(!service.canPublish(sessionId));

    service.updateTagStatus(tags[2].id, TagStatus::Dismissed);
    assert(service.unreviewedCount(sessionId) == 0);
    assert(service.canPublish(sessionId));

    store->setLevel(sessionId, domain::PrivacyLevel::Private);
    assert(!service.canPublish(sessionId));
    store->setLevel(sessionId, domain::PrivacyLevel::Public);
    std::cout << "[PASS] Publish allowed only once every tag is reviewed." << std::endl;

    bool threw = false;
    try {
        service.updateTagStatus("no-such-tag", TagStatus::Accepted);
    } catch (const domain::StorageError&) {
        threw = true;
    }
    assert(threw);

    // Statuses survive a restart
    application::PrivacyTagService reopened(
        std::make_shared<infrastructure::storage::FilePrivacyTagRepository>(testRoot, std::make_shared<infrastructure::PersistenceService>()),
        detector, store, &infrastructure::GenerateId);
    auto reloaded = reopened.getTags(sessionId);
    assert(reloaded.size() == 3);
    assert(reloaded[0].status == TagStatus::Accepted);
    assert(reloaded[1].status == TagStatus::Dismissed);
    assert(reopened.canPublish(sessionId));
    std::cout << "[PASS] Tag statuses persisted." << std::endl;

    // Deleting a session removes its tags and allows a fresh scan
    assert(reopened.deleteSession(sessionId) == 3);
    assert(reopened.getTags(sessionId).empty());
    assert(reopened.deleteSession(sessionId) == 0);
    assert(reopened.scanSession(sessionId, transcript) == 3);
    std::cout << "[PASS] Session tags deleted." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
