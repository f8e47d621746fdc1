/**
 * @file OllamaClassifier.hpp
 * @brief Adapter exposing a local Ollama model as the privacy classifier.
 */

#pragma once
#include "domain/PrivacyClassifier.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace quietledger::infrastructure {

/**
 * @class OllamaClassifier
 * @brief Implements PrivacyClassifier using the Ollama REST API.
 */
class OllamaClassifier : public domain::PrivacyClassifier {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Model used for every request.
     * @param timeoutMs Per-request network timeout.
     */
    OllamaClassifier(const std::string& host, int port, std::string model, int timeoutMs);

    /** @see domain::PrivacyClassifier::complete */
    std::optional<std::string> complete(const std::string& prompt) override;

    std::string modelName() const override { return m_model; }

    /** @brief True if the configured model is installed on the server. */
    bool isModelAvailable();

private:
    OllamaClient m_client;
    std::string m_model;
};

} // namespace quietledger::infrastructure
