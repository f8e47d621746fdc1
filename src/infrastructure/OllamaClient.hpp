/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace quietledger::infrastructure {

class OllamaClient {
public:
    /**
     * @param timeoutMs Bound for connect and read; a classification must never hang the caller's task.
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434, int timeoutMs = 60000);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model, const std::string& prompt);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_timeoutMs;
};

} // namespace quietledger::infrastructure
