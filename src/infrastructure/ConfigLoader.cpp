/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace quietledger::infrastructure {

namespace {

constexpr int kMinPbkdf2Iterations = 1000;

} // namespace

LedgerConfig ConfigLoader::Load(const std::string& projectRoot) {
    LedgerConfig config;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        config.storageRoot = j.value("storage_root", config.storageRoot);

        if (j.contains("classifier") && j["classifier"].is_object()) {
            const auto& c = j["classifier"];
            config.classifier.enabled = c.value("enabled", config.classifier.enabled);
            config.classifier.host = c.value("host", config.classifier.host);
            config.classifier.port = c.value("port", config.classifier.port);
            config.classifier.model = c.value("model", config.classifier.model);
            config.classifier.timeoutMs = c.value("timeout_ms", config.classifier.timeoutMs);
        }

        if (j.contains("vault") && j["vault"].is_object()) {
            int iterations = j["vault"].value("pbkdf2_iterations", config.pbkdf2Iterations);
            if (iterations < kMinPbkdf2Iterations) {
                std::cerr << "[ConfigLoader] pbkdf2_iterations below " << kMinPbkdf2Iterations
                          << ", keeping " << config.pbkdf2Iterations << std::endl;
            } else {
                config.pbkdf2Iterations = iterations;
            }
        }

        if (j.contains("detector") && j["detector"].is_object()) {
            const auto& d = j["detector"];
            std::string policy = d.value("merge_policy", config.mergePolicy);
            if (policy == "first_by_start" || policy == "merge_overlapping") {
                config.mergePolicy = policy;
            } else {
                std::cerr << "[ConfigLoader] Unknown merge_policy '" << policy << "', using "
                          << config.mergePolicy << std::endl;
            }
            if (d.contains("extra_patterns") && d["extra_patterns"].is_object()) {
                for (auto it = d["extra_patterns"].begin(); it != d["extra_patterns"].end(); ++it) {
                    if (it.value().is_string()) {
                        config.extraPatterns.emplace_back(it.key(), it.value().get<std::string>());
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return LedgerConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const std::string& projectRoot, const LedgerConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j;

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Replacing unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["storage_root"] = config.storageRoot;
    j["classifier"] = {
        {"enabled", config.classifier.enabled},
        {"host", config.classifier.host},
        {"port", config.classifier.port},
        {"model", config.classifier.model},
        {"timeout_ms", config.classifier.timeoutMs}
    };
    j["vault"] = {{"pbkdf2_iterations", config.pbkdf2Iterations}};

    nlohmann::json patterns = nlohmann::json::object();
    for (const auto& [name, source] : config.extraPatterns) {
        patterns[name] = source;
    }
    j["detector"] = {{"merge_policy", config.mergePolicy}, {"extra_patterns", patterns}};

    try {
        if (configPath.has_parent_path()) {
            std::filesystem::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        f << j.dump(4);
        return static_cast<bool>(f);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
    return false;
}

} // namespace quietledger::infrastructure
