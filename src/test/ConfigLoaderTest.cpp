#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "app/QuietLedger.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace quietledger;
using infrastructure::ConfigLoader;

namespace {

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    const std::string settingsPath = testRoot + "/settings.json";

    // Missing file
    auto defaults = ConfigLoader::Load(testRoot);
    assert(defaults.storageRoot.empty());
    assert(!defaults.classifier.enabled);
    assert(defaults.classifier.port == 11434);
    assert(defaults.classifier.timeoutMs == 60000);
    assert(defaults.pbkdf2Iterations == 100000);
    assert(defaults.mergePolicy == "first_by_start");
    std::cout << "[PASS] Defaults without settings.json." << std::endl;

    // Partial settings
    WriteFile(settingsPath, R"({
        "storage_root": "data",
        "classifier": { "enabled": true, "model": "llama3:8b", "timeout_ms": 1500 },
        "vault": { "pbkdf2_iterations": 200000 },
        "detector": {
            "merge_policy": "merge_overlapping",
            "extra_patterns": { "Ticket": "TKT-\\d+", "Ignored": 5 }
        },
        "ui": { "theme": "dark" }
    })");
    auto loaded = ConfigLoader::Load(testRoot);
    assert(loaded.storageRoot == "data");
    assert(loaded.classifier.enabled);
    assert(loaded.classifier.host == "localhost");
    assert(loaded.classifier.model == "llama3:8b");
    assert(loaded.classifier.timeoutMs == 1500);
    assert(loaded.pbkdf2Iterations == 200000);
    assert(loaded.mergePolicy == "merge_overlapping");
    assert(loaded.extraPatterns.size() == 1);
    assert(loaded.extraPatterns[0].first == "Ticket");
    std::cout << "[PASS] Settings read with defaults for missing keys." << std::endl;

    // Invalid values fall back
    WriteFile(settingsPath, R"({ "vault": { "pbkdf2_iterations": 10 }, "detector": { "merge_policy": "random" } })");
    auto clamped = ConfigLoader::Load(testRoot);
    assert(clamped.pbkdf2Iterations == 100000);
    assert(clamped.mergePolicy == "first_by_start");

    WriteFile(settingsPath, "{ not json");
    auto malformed = ConfigLoader::Load(testRoot);
    assert(malformed.mergePolicy == "first_by_start");
    assert(!malformed.classifier.enabled);
    std::cout << "[PASS] Bad values and malformed JSON use defaults." << std::endl;

    // Save keeps unrelated keys
    WriteFile(settingsPath, R"({ "ui": { "theme": "dark" } })");
    loaded.classifier.enabled = false;
    assert(ConfigLoader::Save(testRoot, loaded));
    std::ifstream saved(settingsPath);
    nlohmann::json j;
    saved >> j;
    assert(j["ui"]["theme"] == "dark");
    assert(j["detector"]["merge_policy"] == "merge_overlapping");
    assert(j["detector"]["extra_patterns"]["Ticket"] == "TKT-\\d+");
    auto reread = ConfigLoader::Load(testRoot);
    assert(reread.classifier.model == "llama3:8b");
    assert(!reread.classifier.enabled);
    std::cout << "[PASS] Save writes back and preserves unknown keys." << std::endl;

    // The composition root honours the configuration
    infrastructure::LedgerConfig config = reread;
    config.storageRoot = testRoot + "/store";
    config.pbkdf2Iterations = 1000;
    app::QuietLedger ledger(config);
    assert(ledger.getStorageRoot() == testRoot + "/store");
    assert(!ledger.detector().hasClassifier());
    assert(ledger.detector().patternCount() == application::DetectorEngine::DefaultPatterns().size() + 1);
    assert(app::QuietLedger::ParseMergePolicy("merge_overlapping") == application::MergePolicy::MergeOverlapping);
    assert(app::QuietLedger::ParseMergePolicy("anything") == application::MergePolicy::FirstByStartOffset);

    assert(ledger.versions().saveVersion("doc", "hello", "raw") == 1);
    assert(ledger.tags().scanSession("s", "Ticket TKT-77 is open.") == 1);
    auto review = ledger.review().openReview("s", "First. Second.");
    review.markAllPublic();
    assert(ledger.review().commit(review).publicCreated == 2);
    assert(ledger.privacy().isVaultUnlocked());
    assert(std::filesystem::exists(testRoot + "/store/versions"));
    std::cout << "[PASS] QuietLedger wires storage from the configuration." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
