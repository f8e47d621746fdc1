/**
 * @file OllamaClassifier.cpp
 * @brief Implementation of the OllamaClassifier class.
 */
#include "infrastructure/OllamaClassifier.hpp"
#include <algorithm>
#include <iostream>

namespace quietledger::infrastructure {

OllamaClassifier::OllamaClassifier(const std::string& host, int port, std::string model, int timeoutMs)
    : m_client(host, port, timeoutMs), m_model(std::move(model)) {}

std::optional<std::string> OllamaClassifier::complete(const std::string& prompt) {
    return m_client.generate(m_model, prompt);
}

bool OllamaClassifier::isModelAvailable() {
    auto models = m_client.getAvailableModels();
    bool found = std::find(models.begin(), models.end(), m_model) != models.end();
    if (!found) {
        std::cerr << "[OllamaClassifier] Model " << m_model << " not installed. Pull it with 'ollama pull "
                  << m_model << "'" << std::endl;
    }
    return found;
}

} // namespace quietledger::infrastructure
