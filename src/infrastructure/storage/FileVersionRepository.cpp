/**
 * @file FileVersionRepository.cpp
 * @brief Implementation of FileVersionRepository.
 */

#include "infrastructure/storage/FileVersionRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/PrivacyErrors.hpp"
#include <chrono>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

namespace quietledger::infrastructure::storage {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// "v000042.json" -> 42. Temp files and anything else -> -1.
int ParseVersionFileName(const std::string& name) {
    const std::string suffix = ".json";
    if (name.size() <= 1 + suffix.size() || name[0] != 'v') return -1;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return -1;

    std::string digits = name.substr(1, name.size() - 1 - suffix.size());
    if (digits.empty() || digits.size() > 9) return -1;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
    }
    return std::stoi(digits);
}

} // namespace

FileVersionRepository::FileVersionRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence)
    : m_storageRoot(std::move(storageRoot)), m_persistence(std::move(persistence)) {}

std::string FileVersionRepository::versionDirectory(const std::string& documentId) const {
    return (fs::path(m_storageRoot) / "versions" / PathUtils::EncodeFileName(documentId)).string();
}

std::string FileVersionRepository::versionPath(const std::string& documentId, int versionNumber) const {
    std::ostringstream name;
    name << "v" << std::setw(6) << std::setfill('0') << versionNumber << ".json";
    return (fs::path(versionDirectory(documentId)) / name.str()).string();
}

std::string FileVersionRepository::documentPath(const std::string& documentId) const {
    return (fs::path(m_storageRoot) / "documents" / (PathUtils::EncodeFileName(documentId) + ".json")).string();
}

void FileVersionRepository::append(const domain::DocumentVersion& version) {
    if (version.versionNumber < 1) {
        throw domain::StorageError("Version numbers start at 1.");
    }

    json j;
    j["document_id"] = version.documentId;
    j["version"] = version.versionNumber;
    j["type"] = version.versionType;
    j["content"] = version.content;
    j["ts"] = ToMillis(version.createdAt);

    if (!m_persistence->writeExclusive(versionPath(version.documentId, version.versionNumber), j.dump())) {
        throw domain::DuplicateVersion(version.documentId, version.versionNumber);
    }
}

std::vector<domain::DocumentVersion> FileVersionRepository::findByDocument(const std::string& documentId) {
    std::vector<domain::DocumentVersion> results;
    fs::path dir = versionDirectory(documentId);

    std::error_code ec;
    if (!fs::exists(dir, ec)) return results;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (ParseVersionFileName(name) < 0) continue;

        auto text = m_persistence->readText(entry.path().string());
        if (!text) continue;

        try {
            auto j = json::parse(*text);
            domain::DocumentVersion version;
            version.documentId = j.at("document_id").get<std::string>();
            version.versionNumber = j.at("version").get<int>();
            version.versionType = j.at("type").get<std::string>();
            version.content = j.at("content").get<std::string>();
            version.createdAt = FromMillis(j.value("ts", 0LL));
            results.push_back(std::move(version));
        } catch (const json::exception& e) {
            throw domain::StorageError("Corrupted version record " + entry.path().string() + ": " + e.what());
        }
    }
    if (ec) {
        throw domain::StorageError("Cannot list versions of " + documentId + ": " + ec.message());
    }
    return results;
}

std::optional<int> FileVersionRepository::maxVersionNumber(const std::string& documentId) {
    fs::path dir = versionDirectory(documentId);

    std::error_code ec;
    if (!fs::exists(dir, ec)) return std::nullopt;

    std::optional<int> highest;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        int number = ParseVersionFileName(entry.path().filename().string());
        if (number > 0 && (!highest || number > *highest)) {
            highest = number;
        }
    }
    if (ec) {
        throw domain::StorageError("Cannot list versions of " + documentId + ": " + ec.message());
    }
    return highest;
}

void FileVersionRepository::setCurrentContent(const std::string& documentId, int versionNumber, const std::string& content) {
    json j;
    j["document_id"] = documentId;
    j["version"] = versionNumber;
    j["content"] = content;
    j["ts"] = ToMillis(std::chrono::system_clock::now());
    m_persistence->writeAtomic(documentPath(documentId), j.dump());
}

std::optional<domain::CurrentContent> FileVersionRepository::getCurrentContent(const std::string& documentId) {
    auto text = m_persistence->readText(documentPath(documentId));
    if (!text) return std::nullopt;
    try {
        auto j = json::parse(*text);
        domain::CurrentContent current;
        current.versionNumber = j.value("version", 0);
        current.content = j.at("content").get<std::string>();
        return current;
    } catch (const json::exception& e) {
        throw domain::StorageError("Corrupted document record for " + documentId + ": " + e.what());
    }
}

} // namespace quietledger::infrastructure::storage
