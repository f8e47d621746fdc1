/**
 * @file TranscriptParser.cpp
 * @brief Implementation of TranscriptParser.
 */

#include "domain/review/TranscriptParser.hpp"
#include <cctype>

namespace quietledger::domain::review {

namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsTerminator(char ch) {
    return ch == '.' || ch == '!' || ch == '?';
}

// Shrinks [begin, end) so it neither starts nor ends with whitespace.
void Trim(const std::string& text, size_t& begin, size_t& end) {
    while (begin < end && IsSpace(text[begin])) ++begin;
    while (end > begin && IsSpace(text[end - 1])) --end;
}

std::vector<ParsedSentence> SplitSentences(const std::string& text, size_t begin, size_t end) {
    std::vector<ParsedSentence> sentences;

    auto emit = [&](size_t from, size_t to) {
        Trim(text, from, to);
        if (from >= to) return;
        ParsedSentence s;
        s.text = text.substr(from, to - from);
        s.startOffset = static_cast<int>(from);
        s.endOffset = static_cast<int>(to);
        s.wordCount = TranscriptParser::WordCount(s.text);
        sentences.push_back(std::move(s));
    };

    size_t start = begin;
    size_t i = begin;
    while (i < end) {
        if (IsTerminator(text[i]) && i + 1 < end && IsSpace(text[i + 1])) {
            emit(start, i + 1);
            i += 1;
            while (i < end && IsSpace(text[i])) ++i;
            start = i;
            continue;
        }
        ++i;
    }
    emit(start, end);
    return sentences;
}

} // namespace

std::vector<ParsedParagraph> TranscriptParser::Parse(const std::string& text) {
    std::vector<ParsedParagraph> paragraphs;
    if (text.empty()) return paragraphs;

    auto emit = [&](size_t from, size_t to) {
        Trim(text, from, to);
        if (from >= to) return;
        ParsedParagraph p;
        p.startOffset = static_cast<int>(from);
        p.endOffset = static_cast<int>(to);
        p.sentences = SplitSentences(text, from, to);
        if (!p.sentences.empty()) {
            paragraphs.push_back(std::move(p));
        }
    };

    size_t last = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\n') {
            ++i;
            continue;
        }
        size_t runEnd = i;
        int newlines = 0;
        while (runEnd < text.size() && IsSpace(text[runEnd])) {
            if (text[runEnd] == '\n') ++newlines;
            ++runEnd;
        }
        if (newlines >= 2) {
            emit(last, i);
            last = runEnd;
        }
        i = runEnd;
    }
    emit(last, text.size());
    return paragraphs;
}

std::vector<ParsedSentence> TranscriptParser::Sentences(const std::string& text) {
    std::vector<ParsedSentence> all;
    for (auto& paragraph : Parse(text)) {
        for (auto& sentence : paragraph.sentences) {
            all.push_back(std::move(sentence));
        }
    }
    return all;
}

int TranscriptParser::SentenceCount(const std::string& text) {
    return static_cast<int>(Sentences(text).size());
}

int TranscriptParser::WordCount(const std::string& text) {
    int count = 0;
    bool inWord = false;
    for (char ch : text) {
        if (IsSpace(ch)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++count;
        }
    }
    return count;
}

} // namespace quietledger::domain::review
