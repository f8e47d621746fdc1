/**
 * @file QuietLedger.hpp
 * @brief Composition root wiring configuration, storage and services.
 */

#pragma once

#include <memory>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "application/DetectorEngine.hpp"
#include "application/VersionLedger.hpp"
#include "application/PrivacyStateStore.hpp"
#include "application/PrivacyTagService.hpp"
#include "application/SentenceReviewService.hpp"

namespace quietledger::app {

/**
 * @class QuietLedger
 * @brief Owns one instance of every service for a project.
 *
 * Created explicitly by the surrounding application; two instances over the
 * same storage root share nothing but the files.
 */
class QuietLedger {
public:
    /**
     * @brief Loads settings.json from projectRoot and opens the storage it names.
     * @param projectRoot Directory holding settings.json.
     */
    explicit QuietLedger(const std::string& projectRoot);

    /** @brief Opens storage with an already-built configuration. */
    explicit QuietLedger(infrastructure::LedgerConfig config);

    const infrastructure::LedgerConfig& getConfig() const { return m_config; }
    const std::string& getStorageRoot() const { return m_storageRoot; }

    application::DetectorEngine& detector() { return *m_detector; }
    application::VersionLedger& versions() { return *m_versions; }
    application::PrivacyStateStore& privacy() { return *m_privacy; }
    application::PrivacyTagService& tags() { return *m_tags; }
    application::SentenceReviewService& review() { return *m_review; }

    /** @brief Maps the settings.json spelling to a policy. Unknown names fall back to first-by-start. */
    static application::MergePolicy ParseMergePolicy(const std::string& name);

private:
    void wire();

    infrastructure::LedgerConfig m_config;
    std::string m_storageRoot;

    std::shared_ptr<application::DetectorEngine> m_detector;
    std::shared_ptr<application::VersionLedger> m_versions;
    std::shared_ptr<application::PrivacyStateStore> m_privacy;
    std::shared_ptr<application::PrivacyTagService> m_tags;
    std::shared_ptr<application::SentenceReviewService> m_review;
};

} // namespace quietledger::app
