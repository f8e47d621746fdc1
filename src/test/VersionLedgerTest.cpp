#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "application/VersionLedger.hpp"
#include "domain/PrivacyErrors.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/storage/FileVersionRepository.hpp"

using namespace quietledger;
using infrastructure::storage::FileVersionRepository;

// Forwards to a file repository; projection writes fail while the flag is set.
class ProjectionFailingRepository : public domain::VersionRepository {
public:
    explicit ProjectionFailingRepository(std::shared_ptr<domain::VersionRepository> inner)
        : m_inner(std::move(inner)) {}

    void append(const domain::DocumentVersion& version) override { m_inner->append(version); }
    std::vector<domain::DocumentVersion> findByDocument(const std::string& documentId) override {
        return m_inner->findByDocument(documentId);
    }
    std::optional<int> maxVersionNumber(const std::string& documentId) override {
        return m_inner->maxVersionNumber(documentId);
    }
    void setCurrentContent(const std::string& documentId, int versionNumber, const std::string& content) override {
        if (failProjection) throw domain::StorageError("projection disk full");
        m_inner->setCurrentContent(documentId, versionNumber, content);
    }
    std::optional<domain::CurrentContent> getCurrentContent(const std::string& documentId) override {
        return m_inner->getCurrentContent(documentId);
    }

    bool failProjection = false;

private:
    std::shared_ptr<domain::VersionRepository> m_inner;
};

int main() {
    std::cout << "[Test] Starting VersionLedger Test..." << std::endl;

    std::string testRoot = "test_project_root_versions";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_shared<FileVersionRepository>(testRoot, persistence);
    application::VersionLedger ledger(repo);

    // Unknown document
    assert(ledger.getVersions("doc-1").empty());
    assert(!ledger.getLatestVersion("doc-1"));
    assert(ledger.getNextVersionNumber("doc-1") == 1);
    assert(!ledger.getCurrentContent("doc-1"));

    // Sequential saves
    assert(ledger.saveVersion("doc-1", "first draft", domain::version_type::Raw) == 1);
    assert(ledger.saveVersion("doc-1", "second draft", domain::version_type::Edited) == 2);
    assert(ledger.saveVersion("doc-1", "final", domain::version_type::Polished) == 3);
    assert(ledger.getNextVersionNumber("doc-1") == 4);

    auto versions = ledger.getVersions("doc-1");
    assert(versions.size() == 3);
    assert(versions[0].versionNumber == 3);
    assert(versions[2].versionNumber == 1);
    assert(versions[2].content == "first draft");
    assert(versions[1].versionType == "edited");

    auto latest = ledger.getLatestVersion("doc-1");
    assert(latest && latest->versionNumber == 3 && latest->content == "final");
    assert(ledger.getCurrentContent("doc-1") == std::optional<std::string>("final"));
    std::cout << "[PASS] Versions numbered 1..n, newest first." << std::endl;

    // Free-form type is kept verbatim
    assert(ledger.saveVersion("doc-2", "x", "autosave") == 1);
    assert(ledger.getLatestVersion("doc-2")->versionType == "autosave");

    // Restore appends, never rewrites
    auto restored = ledger.restore("doc-1", 1);
    assert(restored.versionNumber == 4);
    assert(restored.versionType == domain::version_type::Restored);
    assert(restored.content == "first draft");
    assert(ledger.getCurrentContent("doc-1") == std::optional<std::string>("first draft"));
    assert(ledger.getVersions("doc-1").size() == 4);
    assert(ledger.getVersions("doc-1").back().content == "first draft");
    std::cout << "[PASS] Restore appends a new version." << std::endl;

    // Missing versions
    bool threw = false;
    try {
        ledger.restore("doc-1", 99);
    } catch (const domain::VersionNotFound& e) {
        threw = std::string(e.what()).find("version not found") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        ledger.restore("doc-1", 0);
    } catch (const domain::VersionNotFound&) {
        threw = true;
    }
    assert(threw);
    assert(ledger.getVersions("doc-1").size() == 4);
    std::cout << "[PASS] Restoring a missing version fails without side effects." << std::endl;

    threw = false;
    try {
        ledger.saveVersion("", "content", domain::version_type::Raw);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // The storage layer refuses a second record for the same number.
    domain::DocumentVersion duplicate;
    duplicate.documentId = "doc-1";
    duplicate.versionNumber = 2;
    duplicate.versionType = domain::version_type::Raw;
    duplicate.content = "overwrite attempt";
    threw = false;
    try {
        repo->append(duplicate);
    } catch (const domain::DuplicateVersion&) {
        threw = true;
    }
    assert(threw);
    for (const auto& v : ledger.getVersions("doc-1")) {
        if (v.versionNumber == 2) assert(v.content == "second draft");
    }
    std::cout << "[PASS] Duplicate version numbers rejected by storage." << std::endl;

    // Identifiers that are not valid file names
    assert(ledger.saveVersion("notes/2024 ../daily", "escaped", domain::version_type::Raw) == 1);
    assert(ledger.getVersions("notes/2024 ../daily").size() == 1);

    // Rehydrate from disk with fresh instances
    auto reopened = std::make_shared<FileVersionRepository>(testRoot, std::make_shared<infrastructure::PersistenceService>());
    application::VersionLedger ledger2(reopened);
    auto reloaded = ledger2.getVersions("doc-1");
    assert(reloaded.size() == 4);
    for (size_t i = 0; i < reloaded.size(); ++i) {
        assert(reloaded[i].versionNumber == static_cast<int>(reloaded.size() - i));
    }
    assert(ledger2.saveVersion("doc-1", "after reopen", domain::version_type::Edited) == 5);
    std::cout << "[PASS] Versions survive a restart." << std::endl;

    // A failed projection refresh neither fails the save nor leaves reads behind.
    auto fileRepo = std::make_shared<FileVersionRepository>(testRoot, persistence);
    auto failing = std::make_shared<ProjectionFailingRepository>(fileRepo);
    application::VersionLedger ledger3(failing);
    assert(ledger3.saveVersion("doc-3", "v1", domain::version_type::Raw) == 1);

    failing->failProjection = true;
    assert(ledger3.saveVersion("doc-3", "v2", domain::version_type::Edited) == 2);
    assert(ledger3.getVersions("doc-3").size() == 2);
    assert(fileRepo->getCurrentContent("doc-3")->versionNumber == 1);
    assert(ledger3.getCurrentContent("doc-3") == std::optional<std::string>("v2"));

    failing->failProjection = false;
    assert(ledger3.getCurrentContent("doc-3") == std::optional<std::string>("v2"));
    auto repaired = fileRepo->getCurrentContent("doc-3");
    assert(repaired && repaired->versionNumber == 2 && repaired->content == "v2");
    assert(ledger3.getNextVersionNumber("doc-3") == 3);
    std::cout << "[PASS] Stale current content is served from history and repaired." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
