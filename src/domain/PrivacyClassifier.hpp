/**
 * @file PrivacyClassifier.hpp
 * @brief Interface for the external (language model) classification collaborator.
 */

#pragma once

#include <string>
#include <optional>

namespace quietledger::domain {

/**
 * @class PrivacyClassifier
 * @brief Sends a single free-text prompt and returns the raw completion.
 *
 * Implementations may block on network I/O. A nullopt result means the
 * service was unreachable or answered with an error.
 */
class PrivacyClassifier {
public:
    virtual ~PrivacyClassifier() = default;

    /** @brief Runs the prompt and returns the completion text. */
    virtual std::optional<std::string> complete(const std::string& prompt) = 0;

    /** @brief Name of the backing model, for logging. */
    virtual std::string modelName() const = 0;
};

} // namespace quietledger::domain
