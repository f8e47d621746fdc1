/**
 * @file SentenceReviewService.cpp
 * @brief Implementation of SentenceReviewService.
 */

#include "application/SentenceReviewService.hpp"
#include "domain/review/TranscriptParser.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace quietledger::application {

using domain::review::ReviewSession;
using domain::review::SentenceDecision;
using domain::review::SentenceDecisionState;
using domain::review::TranscriptParser;

SentenceReviewService::SentenceReviewService(std::shared_ptr<DetectorEngine> detector,
                                             std::shared_ptr<PrivacyStateStore> stateStore,
                                             std::shared_ptr<domain::ContentUnitRepository> cards,
                                             IdGenerator idGenerator)
    : m_detector(std::move(detector)),
      m_stateStore(std::move(stateStore)),
      m_cards(std::move(cards)),
      m_idGenerator(std::move(idGenerator)) {
    if (!m_detector || !m_stateStore || !m_cards || !m_idGenerator) {
        throw std::invalid_argument("SentenceReviewService: missing collaborator.");
    }
}

ReviewSession SentenceReviewService::openReview(const std::string& sessionId, const std::string& transcript) const {
    std::vector<SentenceDecision> sentences;
    for (const auto& parsed : TranscriptParser::Sentences(transcript)) {
        SentenceDecision sentence;
        sentence.text = parsed.text;
        sentence.startOffset = parsed.startOffset;
        sentence.endOffset = parsed.endOffset;
        sentence.matches = m_detector->fullScan(parsed.text);
        sentences.push_back(std::move(sentence));
    }
    return ReviewSession(sessionId, std::move(sentences));
}

CommitReport SentenceReviewService::commit(const ReviewSession& review) {
    CommitReport report;

    for (const auto& sentence : review.getSentences()) {
        if (sentence.decision == SentenceDecisionState::Pending) {
            ++report.skippedPending;
            continue;
        }

        const bool isPrivate = sentence.decision == SentenceDecisionState::Private;

        domain::ContentUnit unit;
        unit.id = m_idGenerator();
        unit.sessionId = review.getSessionId();
        unit.content = sentence.text;
        unit.pile = isPrivate ? domain::card_pile::Vault : domain::card_pile::Inbox;
        unit.createdAt = std::chrono::system_clock::now();

        try {
            // The level goes first so a stored private card is never public by default.
            if (isPrivate) {
                m_stateStore->setLevel(unit.id, domain::PrivacyLevel::Private);
            }
            m_cards->create(unit);
        } catch (const std::exception& e) {
            const std::string label = "Sentence " + std::to_string(sentence.index + 1) +
                                      " (" + domain::review::DecisionToString(sentence.decision) + ")";
            std::cerr << "[SentenceReviewService] " << label << " not saved: " << e.what() << std::endl;
            report.failures.push_back(label + ": " + e.what());
            continue;
        }

        report.createdCardIds.push_back(unit.id);
        if (isPrivate) {
            ++report.privateCreated;
        } else {
            ++report.publicCreated;
        }
    }

    std::cout << "[SentenceReviewService] Saved " << report.succeeded() << " card(s) from review of "
              << review.getSessionId() << " (" << report.publicCreated << " public, "
              << report.privateCreated << " private, " << report.failures.size() << " failed)" << std::endl;
    return report;
}

} // namespace quietledger::application
