/**
 * @file FilePrivacySettingsRepository.cpp
 * @brief Implementation of FilePrivacySettingsRepository.
 */

#include "infrastructure/storage/FilePrivacySettingsRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/PrivacyErrors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace quietledger::infrastructure::storage {

using json = nlohmann::json;
namespace fs = std::filesystem;

FilePrivacySettingsRepository::FilePrivacySettingsRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence)
    : m_storageRoot(std::move(storageRoot)), m_persistence(std::move(persistence)) {}

std::string FilePrivacySettingsRepository::levelDirectory() const {
    return (fs::path(m_storageRoot) / "privacy" / "levels").string();
}

std::string FilePrivacySettingsRepository::levelPath(const std::string& entityId) const {
    return (fs::path(levelDirectory()) / PathUtils::EncodeFileName(entityId)).string();
}

std::string FilePrivacySettingsRepository::vaultPath() const {
    return (fs::path(m_storageRoot) / "privacy" / "vault.json").string();
}

domain::PrivacyLevel FilePrivacySettingsRepository::parseLevel(const std::string& entityId, const std::string& text) const {
    std::string trimmed = text;
    trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isspace(c); }), trimmed.end());

    auto level = domain::PrivacyLevelFromString(trimmed);
    if (!level) {
        std::cerr << "[PrivacySettings] Unreadable level for " << entityId << ", treating as private." << std::endl;
        return domain::PrivacyLevel::Private;
    }
    return *level;
}

std::optional<domain::PrivacyLevel> FilePrivacySettingsRepository::getLevel(const std::string& entityId) {
    auto text = m_persistence->readText(levelPath(entityId));
    if (!text) return std::nullopt;
    return parseLevel(entityId, *text);
}

void FilePrivacySettingsRepository::setLevel(const std::string& entityId, domain::PrivacyLevel level) {
    m_persistence->writeAtomic(levelPath(entityId), domain::PrivacyLevelToString(level));
}

std::vector<std::string> FilePrivacySettingsRepository::listPrivate() {
    std::vector<std::string> ids;
    fs::path dir = levelDirectory();

    std::error_code ec;
    if (!fs::exists(dir, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.find(".tmp") != std::string::npos) continue;

        auto text = m_persistence->readText(entry.path().string());
        if (!text) continue;

        std::string entityId = PathUtils::DecodeFileName(name);
        if (parseLevel(entityId, *text) == domain::PrivacyLevel::Private) {
            ids.push_back(entityId);
        }
    }
    if (ec) {
        throw domain::StorageError("Cannot list privacy levels: " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<domain::VaultCredential> FilePrivacySettingsRepository::getCredential() {
    auto text = m_persistence->readText(vaultPath());
    if (!text) return std::nullopt;

    try {
        auto j = json::parse(*text);
        domain::VaultCredential credential;
        credential.hashHex = j.at("hash").get<std::string>();
        credential.saltHex = j.at("salt").get<std::string>();
        credential.iterations = j.at("iterations").get<int>();
        return credential;
    } catch (const json::exception& e) {
        throw domain::StorageError(std::string("Corrupted vault credential: ") + e.what());
    }
}

void FilePrivacySettingsRepository::setCredential(const domain::VaultCredential& credential) {
    json j;
    j["hash"] = credential.hashHex;
    j["salt"] = credential.saltHex;
    j["iterations"] = credential.iterations;
    m_persistence->writeAtomic(vaultPath(), j.dump(2));
}

} // namespace quietledger::infrastructure::storage
