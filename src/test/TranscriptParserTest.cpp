#include <cassert>
#include <iostream>

#include "domain/review/TranscriptParser.hpp"

using quietledger::domain::review::TranscriptParser;

int main() {
    std::cout << "[Test] Starting TranscriptParser Test..." << std::endl;

    const std::string text = "Hello world. How are you?\n\nSecond para!";
    auto paragraphs = TranscriptParser::Parse(text);

    assert(paragraphs.size() == 2);
    assert(paragraphs[0].sentences.size() == 2);
    assert(paragraphs[0].startOffset == 0);
    assert(paragraphs[0].endOffset == 25);
    assert(paragraphs[0].wordCount() == 5);

    const auto& hello = paragraphs[0].sentences[0];
    assert(hello.text == "Hello world.");
    assert(hello.startOffset == 0 && hello.endOffset == 12);
    assert(hello.wordCount == 2);

    const auto& how = paragraphs[0].sentences[1];
    assert(how.text == "How are you?");
    assert(how.startOffset == 13 && how.endOffset == 25);

    assert(paragraphs[1].startOffset == 27);
    assert(paragraphs[1].sentences[0].text == "Second para!");
    assert(text.substr(paragraphs[1].sentences[0].startOffset, 12) == "Second para!");
    std::cout << "[PASS] Paragraphs and sentences carry byte offsets." << std::endl;

    // A single newline does not start a paragraph
    assert(TranscriptParser::Parse("One line.\nNext line.").size() == 1);
    assert(TranscriptParser::SentenceCount("One line.\nNext line.") == 2);

    // Whitespace-only lines between paragraphs
    assert(TranscriptParser::Parse("A.\n   \n\tB.").size() == 2);

    // Terminators inside numbers do not split
    auto numbers = TranscriptParser::Sentences("It was 3.5 dollars. Fine");
    assert(numbers.size() == 2);
    assert(numbers[0].text == "It was 3.5 dollars.");
    assert(numbers[1].text == "Fine");

    assert(TranscriptParser::Parse("").empty());
    assert(TranscriptParser::Parse(" \n\n \n").empty());
    assert(TranscriptParser::SentenceCount("No terminator at all") == 1);
    std::cout << "[PASS] Boundary rules." << std::endl;

    assert(TranscriptParser::WordCount("  a b  c ") == 3);
    assert(TranscriptParser::WordCount("") == 0);
    assert(TranscriptParser::WordCount("one\ttwo\nthree") == 3);
    std::cout << "[PASS] Word counts." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
