/**
 * @file QuietLedger.cpp
 * @brief Implementation of the QuietLedger composition root.
 */

#include "app/QuietLedger.hpp"

#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/OllamaClassifier.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/Pbkdf2PasswordHasher.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/storage/FileContentUnitRepository.hpp"
#include "infrastructure/storage/FilePrivacySettingsRepository.hpp"
#include "infrastructure/storage/FilePrivacyTagRepository.hpp"
#include "infrastructure/storage/FileVersionRepository.hpp"

#include <iostream>

namespace quietledger::app {

using namespace infrastructure;

QuietLedger::QuietLedger(const std::string& projectRoot)
    : QuietLedger(ConfigLoader::Load(projectRoot)) {}

QuietLedger::QuietLedger(LedgerConfig config)
    : m_config(std::move(config)) {
    m_storageRoot = m_config.storageRoot.empty() ? PathUtils::GetDefaultStorageRoot().string() : m_config.storageRoot;
    wire();
}

application::MergePolicy QuietLedger::ParseMergePolicy(const std::string& name) {
    if (name == "merge_overlapping") {
        return application::MergePolicy::MergeOverlapping;
    }
    return application::MergePolicy::FirstByStartOffset;
}

void QuietLedger::wire() {
    auto persistence = std::make_shared<PersistenceService>();

    std::shared_ptr<domain::PrivacyClassifier> classifier;
    if (m_config.classifier.enabled) {
        auto ollama = std::make_shared<OllamaClassifier>(m_config.classifier.host,
                                                         m_config.classifier.port,
                                                         m_config.classifier.model,
                                                         m_config.classifier.timeoutMs);
        if (!ollama->isModelAvailable()) {
            std::cerr << "[QuietLedger] Classifier model " << m_config.classifier.model
                      << " not reported by Ollama; classification will degrade to local scans." << std::endl;
        }
        classifier = ollama;
    }

    application::DetectorOptions options;
    options.mergePolicy = ParseMergePolicy(m_config.mergePolicy);
    options.classifierTimeout = std::chrono::milliseconds(m_config.classifier.timeoutMs);
    options.extraPatterns = m_config.extraPatterns;
    m_detector = std::make_shared<application::DetectorEngine>(options, classifier);

    m_versions = std::make_shared<application::VersionLedger>(
        std::make_shared<storage::FileVersionRepository>(m_storageRoot, persistence));

    m_privacy = std::make_shared<application::PrivacyStateStore>(
        std::make_shared<storage::FilePrivacySettingsRepository>(m_storageRoot, persistence),
        std::make_shared<Pbkdf2PasswordHasher>(m_config.pbkdf2Iterations));

    m_tags = std::make_shared<application::PrivacyTagService>(
        std::make_shared<storage::FilePrivacyTagRepository>(m_storageRoot, persistence),
        m_detector, m_privacy, &GenerateId);

    m_review = std::make_shared<application::SentenceReviewService>(
        m_detector, m_privacy,
        std::make_shared<storage::FileContentUnitRepository>(m_storageRoot, persistence),
        &GenerateId);

    std::cout << "[QuietLedger] Storage at " << m_storageRoot
              << (classifier ? " (external classifier enabled)" : "") << std::endl;
}

} // namespace quietledger::app
