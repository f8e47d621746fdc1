/**
 * @file TranscriptParser.hpp
 * @brief Splits raw transcript text into paragraphs and sentences with byte offsets.
 */

#pragma once

#include <string>
#include <vector>

namespace quietledger::domain::review {

struct ParsedSentence {
    std::string text;
    int startOffset = 0;
    int endOffset = 0;
    int wordCount = 0;
};

struct ParsedParagraph {
    std::vector<ParsedSentence> sentences;
    int startOffset = 0;
    int endOffset = 0;

    int wordCount() const {
        int total = 0;
        for (const auto& s : sentences) total += s.wordCount;
        return total;
    }
};

/**
 * @class TranscriptParser
 * @brief Paragraphs are separated by a whitespace run holding two or more newlines.
 * Sentences end after '.', '!' or '?' followed by whitespace. Both are trimmed.
 */
class TranscriptParser {
public:
    static std::vector<ParsedParagraph> Parse(const std::string& text);

    /** @brief Flat list of sentences across all paragraphs. */
    static std::vector<ParsedSentence> Sentences(const std::string& text);

    static int SentenceCount(const std::string& text);
    static int WordCount(const std::string& text);
};

} // namespace quietledger::domain::review
