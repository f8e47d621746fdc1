/**
 * @file ReviewSession.hpp
 * @brief Sentence-by-sentence privacy review state machine.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/PrivacyMatch.hpp"

namespace quietledger::domain::review {

/**
 * @enum SentenceDecisionState
 * @brief pending -> public | private. Reviewed sentences never return to pending.
 */
enum class SentenceDecisionState {
    Pending,
    Public,
    Private
};

inline std::string DecisionToString(SentenceDecisionState decision) {
    switch (decision) {
        case SentenceDecisionState::Pending: return "pending";
        case SentenceDecisionState::Public: return "public";
        case SentenceDecisionState::Private: return "private";
        default: return "pending";
    }
}

struct SentenceDecision {
    int index = 0;
    std::string text;
    int startOffset = 0; ///< Position of the sentence in the reviewed document.
    int endOffset = 0;
    std::vector<PrivacyMatch> matches; ///< Offsets relative to the sentence text.
    SentenceDecisionState decision = SentenceDecisionState::Pending;

    bool isReviewed() const { return decision != SentenceDecisionState::Pending; }
};

/**
 * @class ReviewSession
 * @brief Holds the decisions and the cursor of one interactive review.
 *
 * The review is complete once the cursor moves past the last sentence.
 * Single-threaded; callers own synchronization if they share it.
 */
class ReviewSession {
public:
    ReviewSession(std::string sessionId, std::vector<SentenceDecision> sentences);

    const std::string& getSessionId() const { return m_sessionId; }
    const std::vector<SentenceDecision>& getSentences() const { return m_sentences; }
    int getCursor() const { return m_cursor; }
    int size() const { return static_cast<int>(m_sentences.size()); }
    bool isEmpty() const { return m_sentences.empty(); }
    bool isComplete() const { return m_cursor >= size(); }

    /** @brief Sentence under the cursor, or nullptr once complete. */
    const SentenceDecision* current() const;

    // --- Transitions ---

    /** @brief Swipe right: current sentence becomes public, cursor advances. */
    void classifyRight();

    /** @brief Swipe left: current sentence becomes private, cursor advances. */
    void classifyLeft();

    /** @brief pending|public -> private, private -> public. Cursor stays. */
    void toggleCurrent();

    void markAllPublic();
    void markAllPrivate();

    // Navigation never changes decisions and stays within [0, count-1].
    void previous();
    void next();

    // --- Progress ---
    int reviewedCount() const;
    int publicCount() const;
    int privateCount() const;

private:
    void markCurrent(SentenceDecisionState decision);
    void markAll(SentenceDecisionState decision);
    int countWith(SentenceDecisionState decision) const;

    std::string m_sessionId;
    std::vector<SentenceDecision> m_sentences;
    int m_cursor = 0;
};

} // namespace quietledger::domain::review
