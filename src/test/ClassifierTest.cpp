#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "application/DetectorEngine.hpp"
#include "domain/PrivacyClassifier.hpp"
#include "infrastructure/OllamaClassifier.hpp"

using namespace quietledger::application;
using quietledger::domain::PrivacyMatch;

// Mock classifier with a canned answer and an optional delay.
class MockClassifier : public quietledger::domain::PrivacyClassifier {
public:
    MockClassifier(std::optional<std::string> response, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : m_response(std::move(response)), m_delay(delay) {}

    std::optional<std::string> complete(const std::string& prompt) override {
        assert(prompt.find("TYPE|MATCHED_TEXT") != std::string::npos);
        if (m_delay.count() > 0) std::this_thread::sleep_for(m_delay);
        return m_response;
    }

    std::string modelName() const override { return "mock"; }

private:
    std::optional<std::string> m_response;
    std::chrono::milliseconds m_delay;
};

class ThrowingClassifier : public quietledger::domain::PrivacyClassifier {
public:
    std::optional<std::string> complete(const std::string&) override {
        throw std::runtime_error("connection refused");
    }
    std::string modelName() const override { return "broken"; }
};

namespace {

DetectorEngine MakeEngine(std::shared_ptr<quietledger::domain::PrivacyClassifier> classifier,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    DetectorOptions options;
    options.classifierTimeout = timeout;
    return DetectorEngine(options, std::move(classifier));
}

void TestParseResponse() {
    const std::string text = "Bob lives in London.";
    auto matches = DetectorEngine::ParseClassifierResponse(
        "Name|Bob\nNONE\nnot a result\nA|b|c\n  Location | Narnia  \n", text);

    assert(matches.size() == 2);
    assert(matches[0].category == "LLM:Name");
    assert(matches[0].startOffset == 0 && matches[0].endOffset == 3);
    assert(!matches[0].lowConfidence);

    assert(matches[1].category == "LLM:Location");
    assert(matches[1].text == "Narnia");
    assert(matches[1].startOffset == 0 && matches[1].endOffset == 6);
    assert(matches[1].lowConfidence);

    assert(DetectorEngine::ParseClassifierResponse("none", text).empty());
    assert(DetectorEngine::ParseClassifierResponse("Name|Bob", "").empty());
    std::cout << "[PASS] Classifier response parsing." << std::endl;
}

void TestNoClassifier() {
    DetectorEngine engine;
    assert(!engine.hasClassifier());
    assert(engine.classifyExternally("Bob lives in London.").empty());
    std::cout << "[PASS] No classifier configured yields nothing." << std::endl;
}

void TestClassifierResult() {
    auto engine = MakeEngine(std::make_shared<MockClassifier>(std::string("Name|Bob\nLocation|London")));
    auto matches = engine.classifyExternally("Bob lives in London.");
    assert(matches.size() == 2);
    assert(matches[0].category == "LLM:Name");
    assert(matches[1].category == "LLM:Location");
    assert(matches[1].startOffset == 13);

    auto none = MakeEngine(std::make_shared<MockClassifier>(std::string("NONE")));
    assert(none.classifyExternally("Nothing to see.").empty());
    std::cout << "[PASS] Classifier findings mapped to offsets." << std::endl;
}

void TestUnavailableClassifierDegrades() {
    auto silent = MakeEngine(std::make_shared<MockClassifier>(std::nullopt));
    assert(silent.classifyExternally("Bob lives in London.").empty());

    auto throwing = MakeEngine(std::make_shared<ThrowingClassifier>());
    assert(throwing.classifyExternally("Bob lives in London.").empty());

    // Local detection still works when the classifier fails.
    auto combined = throwing.scanWithClassifier("Mail bob@example.com");
    assert(combined.size() == 1);
    assert(combined[0].category == "Email");
    std::cout << "[PASS] Unavailable classifier degrades to empty." << std::endl;
}

void TestTimeout() {
    auto engine = MakeEngine(std::make_shared<MockClassifier>(std::string("Name|Bob"), std::chrono::milliseconds(800)),
                             std::chrono::milliseconds(100));

    auto start = std::chrono::steady_clock::now();
    auto matches = engine.classifyExternally("Bob lives in London.");
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(matches.empty());
    assert(elapsed < std::chrono::milliseconds(600));

    // The abandoned call finishes in the background and is then forgotten.
    assert(engine.pendingClassifications() == 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    assert(engine.pendingClassifications() == 0);
    std::cout << "[PASS] Slow classifier abandoned after timeout." << std::endl;
}

void TestCancellation() {
    auto engine = MakeEngine(std::make_shared<MockClassifier>(std::string("Name|Bob"), std::chrono::milliseconds(800)));

    auto precancelled = std::make_shared<CancellationToken>();
    precancelled->cancel();
    assert(engine.classifyExternally("Bob lives in London.", precancelled).empty());

    auto token = std::make_shared<CancellationToken>();
    auto start = std::chrono::steady_clock::now();
    auto future = engine.classifyExternallyAsync("Bob lives in London.", token);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token->cancel();
    auto matches = future.get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(matches.empty());
    assert(elapsed < std::chrono::milliseconds(600));
    std::cout << "[PASS] Cancellation stops waiting for the classifier." << std::endl;
}

void TestScanWithClassifier() {
    auto engine = MakeEngine(std::make_shared<MockClassifier>(std::string("Name|Bob")));
    const std::string text = "Email bob@example.com to Bob.";
    auto matches = engine.scanWithClassifier(text);

    assert(matches.size() == 2);
    assert(matches[0].category == "Email");
    assert(matches[0].startOffset == 6);
    assert(matches[1].category == "LLM:Name");
    assert(matches[1].startOffset == 25);
    std::cout << "[PASS] Local and classifier findings combined." << std::endl;
}

void TestUnreachableOllama() {
    // Nothing listens on port 1.
    auto ollama = std::make_shared<quietledger::infrastructure::OllamaClassifier>("127.0.0.1", 1, "qwen2.5:3b", 500);
    assert(!ollama->isModelAvailable());
    assert(!ollama->complete("TYPE|MATCHED_TEXT"));

    auto engine = MakeEngine(ollama);
    auto matches = engine.scanWithClassifier("Mail bob@example.com");
    assert(matches.size() == 1);
    assert(matches[0].category == "Email");
    std::cout << "[PASS] Unreachable Ollama degrades to local results." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Classifier Test..." << std::endl;

    TestParseResponse();
    TestNoClassifier();
    TestClassifierResult();
    TestUnavailableClassifierDegrades();
    TestTimeout();
    TestCancellation();
    TestScanWithClassifier();
    TestUnreachableOllama();

    // Let abandoned mock calls finish before teardown.
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
