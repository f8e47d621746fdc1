/**
 * @file PrivacyMatch.hpp
 * @brief Value object for a sensitive span found by a detector.
 */

#pragma once

#include <string>

namespace quietledger::domain {

/**
 * @struct PrivacyMatch
 * @brief A detected sensitive span. Transient; persisted as a PrivacyTag.
 *
 * Invariant: 0 <= startOffset < endOffset <= text length (byte offsets).
 */
struct PrivacyMatch {
    std::string category;   ///< Pattern name, "Topic:<category>" or "LLM:<type>".
    std::string text;       ///< Matched text with original casing.
    int startOffset = 0;
    int endOffset = 0;
    bool lowConfidence = false; ///< Set when offsets could not be located in the source text.
};

inline bool operator==(const PrivacyMatch& a, const PrivacyMatch& b) {
    return a.category == b.category && a.text == b.text &&
           a.startOffset == b.startOffset && a.endOffset == b.endOffset;
}

} // namespace quietledger::domain
