/**
 * @file ReviewSession.cpp
 * @brief Implementation of ReviewSession.
 */

#include "domain/review/ReviewSession.hpp"
#include <algorithm>

namespace quietledger::domain::review {

ReviewSession::ReviewSession(std::string sessionId, std::vector<SentenceDecision> sentences)
    : m_sessionId(std::move(sessionId)), m_sentences(std::move(sentences)) {
    for (size_t i = 0; i < m_sentences.size(); ++i) {
        m_sentences[i].index = static_cast<int>(i);
        m_sentences[i].decision = SentenceDecisionState::Pending;
    }
}

const SentenceDecision* ReviewSession::current() const {
    if (isComplete()) return nullptr;
    return &m_sentences[static_cast<size_t>(m_cursor)];
}

void ReviewSession::classifyRight() {
    if (isComplete()) return;
    markCurrent(SentenceDecisionState::Public);
    ++m_cursor;
}

void ReviewSession::classifyLeft() {
    if (isComplete()) return;
    markCurrent(SentenceDecisionState::Private);
    ++m_cursor;
}

void ReviewSession::toggleCurrent() {
    if (isComplete()) return;
    auto& sentence = m_sentences[static_cast<size_t>(m_cursor)];
    switch (sentence.decision) {
        case SentenceDecisionState::Pending:
        case SentenceDecisionState::Public:
            sentence.decision = SentenceDecisionState::Private;
            break;
        case SentenceDecisionState::Private:
            sentence.decision = SentenceDecisionState::Public;
            break;
    }
}

void ReviewSession::markAllPublic() {
    markAll(SentenceDecisionState::Public);
}

void ReviewSession::markAllPrivate() {
    markAll(SentenceDecisionState::Private);
}

void ReviewSession::previous() {
    if (m_sentences.empty()) return;
    if (m_cursor > 0) {
        m_cursor = std::min(m_cursor - 1, size() - 1);
    }
}

void ReviewSession::next() {
    if (m_cursor < size() - 1) {
        ++m_cursor;
    }
}

int ReviewSession::reviewedCount() const {
    return static_cast<int>(std::count_if(m_sentences.begin(), m_sentences.end(),
        [](const SentenceDecision& s) { return s.isReviewed(); }));
}

int ReviewSession::publicCount() const {
    return countWith(SentenceDecisionState::Public);
}

int ReviewSession::privateCount() const {
    return countWith(SentenceDecisionState::Private);
}

void ReviewSession::markCurrent(SentenceDecisionState decision) {
    m_sentences[static_cast<size_t>(m_cursor)].decision = decision;
}

void ReviewSession::markAll(SentenceDecisionState decision) {
    for (auto& sentence : m_sentences) {
        sentence.decision = decision;
    }
    m_cursor = size();
}

int ReviewSession::countWith(SentenceDecisionState decision) const {
    return static_cast<int>(std::count_if(m_sentences.begin(), m_sentences.end(),
        [decision](const SentenceDecision& s) { return s.decision == decision; }));
}

} // namespace quietledger::domain::review
