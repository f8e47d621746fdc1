/**
 * @file DetectorEngine.cpp
 * @brief Implementation of DetectorEngine.
 */

#include "application/DetectorEngine.hpp"
#include "domain/PrivacyErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <unordered_set>
#include <set>

namespace quietledger::application {

using domain::PrivacyMatch;

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{50};

// Longest whitespace or non-whitespace run handed to the regex table.
// std::regex recursion depth grows with the run being matched.
constexpr size_t kMaxRunLength = 256;

struct ScanWindow {
    size_t begin;
    size_t end;
};

bool IsSpaceChar(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// Splits text into windows separated by oversized runs; those runs are excluded.
std::vector<ScanWindow> BoundedWindows(const std::string& text, size_t& skippedRuns) {
    std::vector<ScanWindow> windows;
    skippedRuns = 0;

    size_t windowStart = 0;
    size_t i = 0;
    while (i < text.size()) {
        const bool space = IsSpaceChar(text[i]);
        size_t j = i;
        while (j < text.size() && IsSpaceChar(text[j]) == space) ++j;

        if (j - i > kMaxRunLength) {
            if (i > windowStart) windows.push_back({windowStart, i});
            windowStart = j;
            ++skippedRuns;
        }
        i = j;
    }
    if (windowStart < text.size()) windows.push_back({windowStart, text.size()});
    return windows;
}

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(const std::string& value) {
    const char* ws = " \t\r\n";
    size_t start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

bool ByStartOffset(const PrivacyMatch& a, const PrivacyMatch& b) {
    return a.startOffset < b.startOffset;
}

bool IsValidSpan(const PrivacyMatch& m, size_t textLength) {
    return m.startOffset >= 0 && m.startOffset < m.endOffset &&
           static_cast<size_t>(m.endOffset) <= textLength;
}

} // namespace

const std::vector<std::pair<std::string, std::string>>& DetectorEngine::DefaultPatterns() {
    static const std::vector<std::pair<std::string, std::string>> patterns = {
        {"SSN", R"(\d{3}-\d{2}-\d{4})"},
        {"Credit Card", R"(\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4})"},
        {"Email", R"(\w+@\w+\.\w+)"},
        {"Phone", R"(\(?\d{3}\)?[\s-]?\d{3}[\s-]?\d{4})"},
        {"IP Address", R"(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})"},
        // Symbols are multi-byte in UTF-8, so they are alternatives rather than a bracket set.
        {"Currency", R"((?:£|\$|€)\s?\d[\d,\.]*)"},
        {"Money Words", R"(\d[\d,\.]*\s*(pounds?|dollars?|euros?|quid|grand|k\b))"}
    };
    return patterns;
}

const std::vector<TopicCategory>& DetectorEngine::TopicCategories() {
    static const std::vector<TopicCategory> categories = {
        {"Medical", {
            "doctor", "hospital", "medication", "prescription", "diagnosis",
            "hemorrhoid", "piles", "ointment", "cream", "suppository",
            "blood", "symptom", "disease", "illness", "surgery", "operation",
            "therapist", "psychiatrist", "counselor", "psychologist",
            "xanax", "antidepressant", "ssri", "prozac", "valium",
            "cancer", "tumor", "biopsy", "scan", "mri", "x-ray"
        }},
        {"Mental Health", {
            "depressed", "depression", "anxiety", "anxious", "panic attack",
            "suicidal", "self-harm", "cutting", "overdose", "breakdown",
            "mental health", "bipolar", "schizophrenia", "ptsd", "trauma",
            "feel low", "feel down", "can't cope", "hopeless", "worthless"
        }},
        {"Financial", {
            "salary", "income", "debt", "loan", "mortgage", "bank account",
            "stock market", "trading", "investment", "portfolio", "shares",
            "tax return", "owe money", "credit score", "bankruptcy",
            "made money", "lost money", "profit", "bonus"
        }},
        {"Embarrassing", {
            "anus", "rectum", "rectal", "bowel", "constipation", "diarrhea",
            "penis", "vagina", "genitals", "erectile", "impotent",
            "std", "herpes", "chlamydia", "gonorrhea", "hiv",
            "vomit", "puke", "shit myself", "wet myself", "incontinence"
        }},
        {"Legal", {
            "arrested", "court case", "lawsuit", "criminal record",
            "police", "prison", "jail", "conviction", "probation",
            "lawyer", "solicitor", "court order", "restraining order"
        }},
        {"Addiction", {
            "alcoholic", "addict", "addiction", "rehab", "withdrawal",
            "cocaine", "heroin", "meth", "overdose", "relapse",
            "aa meeting", "na meeting", "sponsor", "sober", "recovery"
        }}
    };
    return categories;
}

DetectorEngine::CompiledPattern DetectorEngine::CompilePattern(const std::string& name, const std::string& source) {
    try {
        return CompiledPattern{name, std::regex(source, std::regex::ECMAScript | std::regex::optimize)};
    } catch (const std::regex_error& e) {
        throw domain::DetectionError(name, e.what());
    }
}

DetectorEngine::DetectorEngine(DetectorOptions options, std::shared_ptr<domain::PrivacyClassifier> classifier)
    : m_options(std::move(options)), m_classifier(std::move(classifier)) {
    std::vector<std::pair<std::string, std::string>> sources = DefaultPatterns();
    sources.insert(sources.end(), m_options.extraPatterns.begin(), m_options.extraPatterns.end());

    for (const auto& [name, source] : sources) {
        try {
            m_patterns.push_back(CompilePattern(name, source));
        } catch (const domain::DetectionError& e) {
            std::cerr << "[DetectorEngine] Skipping pattern: " << e.what() << std::endl;
        }
    }
}

std::vector<PrivacyMatch> DetectorEngine::scan(const std::string& text) const {
    std::vector<PrivacyMatch> matches;
    if (text.empty()) return matches;

    size_t skippedRuns = 0;
    const auto windows = BoundedWindows(text, skippedRuns);
    if (skippedRuns > 0) {
        std::cerr << "[DetectorEngine] Skipped " << skippedRuns << " run(s) longer than "
                  << kMaxRunLength << " bytes; pattern scan covers the rest." << std::endl;
    }

    for (const auto& pattern : m_patterns) {
        try {
            for (const auto& window : windows) {
                auto first = text.begin() + static_cast<std::ptrdiff_t>(window.begin);
                auto last = text.begin() + static_cast<std::ptrdiff_t>(window.end);
                // Lets \b see the character before the window.
                auto flags = window.begin > 0 ? std::regex_constants::match_prev_avail
                                              : std::regex_constants::match_default;

                for (auto it = std::sregex_iterator(first, last, pattern.regex, flags); it != std::sregex_iterator(); ++it) {
                    const auto& result = *it;
                    if (result.length(0) <= 0) continue;

                    PrivacyMatch match;
                    match.category = pattern.name;
                    match.text = result.str(0);
                    match.startOffset = static_cast<int>(window.begin + static_cast<size_t>(result.position(0)));
                    match.endOffset = match.startOffset + static_cast<int>(result.length(0));
                    if (IsValidSpan(match, text.size())) {
                        matches.push_back(std::move(match));
                    }
                }
            }
        } catch (const std::regex_error& e) {
            // Runtime failures (e.g. backtracking limits) drop this pattern only.
            std::cerr << "[DetectorEngine] Pattern '" << pattern.name << "' failed on input: " << e.what() << std::endl;
        }
    }

    std::stable_sort(matches.begin(), matches.end(), ByStartOffset);
    return matches;
}

std::vector<PrivacyMatch> DetectorEngine::scanTopics(const std::string& text) const {
    std::vector<PrivacyMatch> matches;
    if (text.empty()) return matches;

    // ASCII lower-casing keeps byte offsets identical to the original text.
    const std::string lowerText = ToLower(text);

    for (const auto& category : TopicCategories()) {
        for (const auto& keyword : category.keywords) {
            size_t pos = lowerText.find(keyword);
            while (pos != std::string::npos) {
                PrivacyMatch match;
                match.category = "Topic:" + category.name;
                match.text = text.substr(pos, keyword.size());
                match.startOffset = static_cast<int>(pos);
                match.endOffset = static_cast<int>(pos + keyword.size());
                matches.push_back(std::move(match));

                pos = lowerText.find(keyword, pos + keyword.size());
            }
        }
    }

    // One topic per position, earlier categories win.
    std::unordered_set<int> seen;
    matches.erase(std::remove_if(matches.begin(), matches.end(),
        [&seen](const PrivacyMatch& m) { return !seen.insert(m.startOffset).second; }),
        matches.end());

    std::stable_sort(matches.begin(), matches.end(), ByStartOffset);
    return matches;
}

std::vector<PrivacyMatch> DetectorEngine::fullScan(const std::string& text) const {
    return fullScan(text, m_options.mergePolicy);
}

std::vector<PrivacyMatch> DetectorEngine::fullScan(const std::string& text, MergePolicy policy) const {
    auto all = scan(text);
    auto topics = scanTopics(text);
    all.insert(all.end(), std::make_move_iterator(topics.begin()), std::make_move_iterator(topics.end()));
    return MergeMatches(std::move(all), policy);
}

std::vector<PrivacyMatch> DetectorEngine::MergeMatches(std::vector<PrivacyMatch> matches, MergePolicy policy) {
    std::stable_sort(matches.begin(), matches.end(), ByStartOffset);

    if (policy == MergePolicy::FirstByStartOffset) {
        std::unordered_set<int> seen;
        matches.erase(std::remove_if(matches.begin(), matches.end(),
            [&seen](const PrivacyMatch& m) { return !seen.insert(m.startOffset).second; }),
            matches.end());
        return matches;
    }

    std::stable_sort(matches.begin(), matches.end(), [](const PrivacyMatch& a, const PrivacyMatch& b) {
        if (a.startOffset != b.startOffset) return a.startOffset < b.startOffset;
        return a.endOffset < b.endOffset;
    });
    std::set<std::pair<int, int>> spans;
    matches.erase(std::remove_if(matches.begin(), matches.end(),
        [&spans](const PrivacyMatch& m) { return !spans.insert({m.startOffset, m.endOffset}).second; }),
        matches.end());
    return matches;
}

bool DetectorEngine::containsPrivateTopics(const std::string& text) const {
    const std::string lowerText = ToLower(text);
    for (const auto& category : TopicCategories()) {
        for (const auto& keyword : category.keywords) {
            if (lowerText.find(keyword) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

std::string DetectorEngine::BuildClassifierPrompt(const std::string& text) {
    std::ostringstream prompt;
    prompt << "Analyze the following text and identify any private or sensitive information.\n\n"
           << "For each piece of sensitive information found, output a line in this exact format:\n"
           << "TYPE|MATCHED_TEXT\n\n"
           << "Valid types are: Name, Address, Phone, Email, SSN, Credit Card, Medical, Financial, Password, Location\n\n"
           << "If no sensitive information is found, respond with: NONE\n\n"
           << "Text to analyze:\n---\n" << text << "\n---\n\n"
           << "Respond ONLY with the formatted lines or NONE, nothing else.";
    return prompt.str();
}

std::vector<PrivacyMatch> DetectorEngine::ParseClassifierResponse(const std::string& response,
                                                                  const std::string& originalText) {
    std::vector<PrivacyMatch> matches;
    if (originalText.empty()) return matches;

    std::istringstream lines(response);
    std::string line;
    while (std::getline(lines, line)) {
        line = Trim(line);
        if (line.empty()) continue;
        if (ToLower(line) == "none") continue;

        size_t bar = line.find('|');
        if (bar == std::string::npos || line.find('|', bar + 1) != std::string::npos) {
            continue;
        }

        std::string type = Trim(line.substr(0, bar));
        std::string matchedText = Trim(line.substr(bar + 1));
        if (type.empty() || matchedText.empty()) continue;

        PrivacyMatch match;
        match.category = "LLM:" + type;
        match.text = matchedText;

        size_t pos = originalText.find(matchedText);
        if (pos != std::string::npos) {
            match.startOffset = static_cast<int>(pos);
            match.endOffset = static_cast<int>(pos + matchedText.size());
        } else {
            match.startOffset = 0;
            match.endOffset = static_cast<int>(std::min(matchedText.size(), originalText.size()));
            match.lowConfidence = true;
        }
        matches.push_back(std::move(match));
    }

    std::stable_sort(matches.begin(), matches.end(), ByStartOffset);
    return matches;
}

std::vector<PrivacyMatch> DetectorEngine::classifyExternally(const std::string& text,
                                                             std::shared_ptr<CancellationToken> token) const {
    if (!m_classifier || text.empty()) return {};

    // The worker is the only producer; an abandoned result is simply never read.
    auto promise = std::make_shared<std::promise<std::vector<PrivacyMatch>>>();
    auto future = promise->get_future();
    auto classifier = m_classifier;
    std::string prompt = BuildClassifierPrompt(text);

    auto status = m_tasks.SubmitTask(TaskType::Classification,
        "classify " + std::to_string(text.size()) + " bytes with " + classifier->modelName(),
        [promise, classifier, prompt, text](std::shared_ptr<TaskStatus> /*status*/) {
            try {
                auto response = classifier->complete(prompt);
                if (!response) {
                    throw domain::ClassifierUnavailable("no response from " + classifier->modelName());
                }
                promise->set_value(ParseClassifierResponse(*response, text));
            } catch (...) {
                promise->set_exception(std::current_exception());
                throw;
            }
        });

    const auto deadline = std::chrono::steady_clock::now() + m_options.classifierTimeout;
    while (true) {
        if (token && token->isCancelled()) {
            status->cancelled = true;
            std::cout << "[DetectorEngine] Classification cancelled; using rule-based results only." << std::endl;
            return {};
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            status->cancelled = true;
            std::cerr << "[DetectorEngine] Classifier timed out after "
                      << m_options.classifierTimeout.count() << " ms." << std::endl;
            return {};
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kCancelPollInterval);
        if (future.wait_for(slice) == std::future_status::ready) {
            break;
        }
    }

    try {
        auto matches = future.get();
        std::vector<PrivacyMatch> valid;
        for (auto& m : matches) {
            if (IsValidSpan(m, text.size())) valid.push_back(std::move(m));
        }
        return valid;
    } catch (const domain::ClassifierUnavailable& e) {
        std::cerr << "[DetectorEngine] " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[DetectorEngine] Classification failed: " << e.what() << std::endl;
    }
    return {};
}

std::future<std::vector<PrivacyMatch>> DetectorEngine::classifyExternallyAsync(const std::string& text,
                                                                               std::shared_ptr<CancellationToken> token) const {
    return std::async(std::launch::async, [this, text, token]() {
        return classifyExternally(text, token);
    });
}

std::vector<PrivacyMatch> DetectorEngine::scanWithClassifier(const std::string& text,
                                                             std::shared_ptr<CancellationToken> token) const {
    std::future<std::vector<PrivacyMatch>> remote;
    if (m_classifier) {
        remote = classifyExternallyAsync(text, token);
    }

    auto matches = fullScan(text);

    if (remote.valid()) {
        auto external = remote.get();
        matches.insert(matches.end(), std::make_move_iterator(external.begin()), std::make_move_iterator(external.end()));
        matches = MergeMatches(std::move(matches), m_options.mergePolicy);
    }
    return matches;
}

} // namespace quietledger::application
