/**
 * @file SentenceReviewService.hpp
 * @brief Opens sentence reviews and commits the decisions as cards.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include "application/DetectorEngine.hpp"
#include "application/PrivacyStateStore.hpp"
#include "domain/review/ReviewSession.hpp"
#include "domain/repositories/ContentUnitRepository.hpp"

namespace quietledger::application {

/**
 * @struct CommitReport
 * @brief Outcome of a best-effort commit. Failures are listed, never hidden.
 */
struct CommitReport {
    int publicCreated = 0;
    int privateCreated = 0;
    int skippedPending = 0;
    std::vector<std::string> createdCardIds;
    std::vector<std::string> failures; ///< One message per sentence that could not be stored.

    int succeeded() const { return publicCreated + privateCreated; }
    bool isPartial() const { return !failures.empty(); }
};

/**
 * @class SentenceReviewService
 * @brief Segments a transcript, attaches detector matches to each sentence and
 * materializes reviewed sentences into content units.
 */
class SentenceReviewService {
public:
    using IdGenerator = std::function<std::string()>;

    SentenceReviewService(std::shared_ptr<DetectorEngine> detector,
                          std::shared_ptr<PrivacyStateStore> stateStore,
                          std::shared_ptr<domain::ContentUnitRepository> cards,
                          IdGenerator idGenerator);

    /** @brief Every sentence starts pending. */
    domain::review::ReviewSession openReview(const std::string& sessionId, const std::string& transcript) const;

    /**
     * @brief Public sentences become inbox cards, private ones vault cards
     * marked private. Pending sentences are dropped.
     */
    CommitReport commit(const domain::review::ReviewSession& review);

private:
    std::shared_ptr<DetectorEngine> m_detector;
    std::shared_ptr<PrivacyStateStore> m_stateStore;
    std::shared_ptr<domain::ContentUnitRepository> m_cards;
    IdGenerator m_idGenerator;
};

} // namespace quietledger::application
