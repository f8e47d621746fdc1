/**
 * @file DetectorEngine.hpp
 * @brief Detection of sensitive spans by patterns, topic keywords and an optional external classifier.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <future>
#include <regex>
#include <utility>
#include "domain/PrivacyMatch.hpp"
#include "domain/PrivacyClassifier.hpp"
#include "application/AsyncTaskManager.hpp"

namespace quietledger::application {

/**
 * @enum MergePolicy
 * @brief How fullScan resolves matches that start at the same offset.
 */
enum class MergePolicy {
    FirstByStartOffset, ///< At most one match per start offset; first after sorting wins.
    MergeOverlapping    ///< Keeps every distinct (start, end) span; only exact span duplicates collapse.
};

struct DetectorOptions {
    MergePolicy mergePolicy = MergePolicy::FirstByStartOffset;
    std::chrono::milliseconds classifierTimeout{60000};
    /// Appended to the built-in table as (name, ECMAScript regex).
    std::vector<std::pair<std::string, std::string>> extraPatterns;
};

/**
 * @class CancellationToken
 * @brief Lets a caller abandon an in-flight classification.
 */
class CancellationToken {
public:
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

struct TopicCategory {
    std::string name;
    std::vector<std::string> keywords; ///< Lower-case.
};

/**
 * @class DetectorEngine
 * @brief Text in, matches out. Scans never mutate their input and never throw
 * because of a bad pattern or an unavailable classifier.
 *
 * Local scans are const and safe to call concurrently. Classification runs on
 * a background task bounded by DetectorOptions::classifierTimeout.
 */
class DetectorEngine {
public:
    explicit DetectorEngine(DetectorOptions options = {},
                            std::shared_ptr<domain::PrivacyClassifier> classifier = nullptr);

    /**
     * @brief Applies the regular expression table. Sorted by start offset.
     * Whitespace or non-whitespace runs longer than 256 bytes are not pattern-scanned.
     */
    std::vector<domain::PrivacyMatch> scan(const std::string& text) const;

    /** @brief Case-insensitive keyword search per topic category, tagged "Topic:<category>". */
    std::vector<domain::PrivacyMatch> scanTopics(const std::string& text) const;

    /** @brief Pattern and topic matches merged with the configured policy. */
    std::vector<domain::PrivacyMatch> fullScan(const std::string& text) const;

    std::vector<domain::PrivacyMatch> fullScan(const std::string& text, MergePolicy policy) const;

    /** @brief Quick check: does the text mention any sensitive topic at all. */
    bool containsPrivateTopics(const std::string& text) const;

    /**
     * @brief Asks the external classifier for sensitive spans.
     *
     * Blocks at most for the configured timeout. Timeout, cancellation,
     * unreachable service and malformed output all yield an empty result.
     */
    std::vector<domain::PrivacyMatch> classifyExternally(const std::string& text,
                                                         std::shared_ptr<CancellationToken> token = nullptr) const;

    /**
     * @brief Same as classifyExternally, on its own thread.
     * The engine must outlive the returned future.
     */
    std::future<std::vector<domain::PrivacyMatch>> classifyExternallyAsync(const std::string& text,
                                                                           std::shared_ptr<CancellationToken> token = nullptr) const;

    /** @brief fullScan combined with whatever the classifier returns in time. */
    std::vector<domain::PrivacyMatch> scanWithClassifier(const std::string& text,
                                                         std::shared_ptr<CancellationToken> token = nullptr) const;

    bool hasClassifier() const { return m_classifier != nullptr; }
    size_t patternCount() const { return m_patterns.size(); }
    /// Classifier calls still running, including abandoned ones.
    size_t pendingClassifications() const { return m_tasks.GetActiveTasks().size(); }

    static const std::vector<std::pair<std::string, std::string>>& DefaultPatterns();
    static const std::vector<TopicCategory>& TopicCategories();

    static std::string BuildClassifierPrompt(const std::string& text);

    /**
     * @brief Parses "CATEGORY|MATCHED_TEXT" lines. "NONE" and other shapes are ignored.
     * Text not found in the original gets offset 0 and lowConfidence.
     */
    static std::vector<domain::PrivacyMatch> ParseClassifierResponse(const std::string& response,
                                                                     const std::string& originalText);

    static std::vector<domain::PrivacyMatch> MergeMatches(std::vector<domain::PrivacyMatch> matches, MergePolicy policy);

private:
    struct CompiledPattern {
        std::string name;
        std::regex regex;
    };

    /** @throws domain::DetectionError */
    static CompiledPattern CompilePattern(const std::string& name, const std::string& source);

    DetectorOptions m_options;
    std::vector<CompiledPattern> m_patterns;
    std::shared_ptr<domain::PrivacyClassifier> m_classifier;
    mutable AsyncTaskManager m_tasks;
};

} // namespace quietledger::application
