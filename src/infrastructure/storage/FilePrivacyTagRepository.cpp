#include "infrastructure/storage/FilePrivacyTagRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/PrivacyErrors.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>

namespace quietledger::infrastructure::storage {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json TagToJson(const domain::PrivacyTag& tag) {
    json j;
    j["id"] = tag.id;
    j["session_id"] = tag.sessionId;
    j["start"] = tag.startOffset;
    j["end"] = tag.endOffset;
    j["status"] = domain::TagStatusToString(tag.status);
    j["tag_type"] = tag.tagType;
    j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(tag.createdAt.time_since_epoch()).count();
    return j;
}

domain::PrivacyTag TagFromJson(const json& j) {
    domain::PrivacyTag tag;
    tag.id = j.at("id").get<std::string>();
    tag.sessionId = j.at("session_id").get<std::string>();
    tag.startOffset = j.at("start").get<int>();
    tag.endOffset = j.at("end").get<int>();
    auto status = domain::TagStatusFromString(j.value("status", ""));
    if (!status) {
        std::cerr << "[TagRepository] Unknown status on tag " << tag.id << ", treating as unreviewed." << std::endl;
    }
    tag.status = status.value_or(domain::TagStatus::Unreviewed);
    tag.tagType = j.value("tag_type", "");
    tag.createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(j.value("ts", 0LL)));
    return tag;
}

} // namespace

FilePrivacyTagRepository::FilePrivacyTagRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence)
    : m_storageRoot(std::move(storageRoot)), m_persistence(std::move(persistence)) {}

std::string FilePrivacyTagRepository::sessionPath(const std::string& sessionId) const {
    return (fs::path(m_storageRoot) / "privacy" / "tags" / (PathUtils::EncodeFileName(sessionId) + ".json")).string();
}

std::string FilePrivacyTagRepository::indexPath() const {
    return (fs::path(m_storageRoot) / "privacy" / "tag_index.json").string();
}

std::vector<domain::PrivacyTag> FilePrivacyTagRepository::loadSession(const std::string& sessionId) const {
    std::vector<domain::PrivacyTag> tags;
    auto text = m_persistence->readText(sessionPath(sessionId));
    if (!text) return tags;

    try {
        for (const auto& item : json::parse(*text)) {
            tags.push_back(TagFromJson(item));
        }
    } catch (const json::exception& e) {
        throw domain::StorageError("Corrupted tag file for session " + sessionId + ": " + e.what());
    }
    return tags;
}

void FilePrivacyTagRepository::saveSession(const std::string& sessionId, const std::vector<domain::PrivacyTag>& tags) {
    json arr = json::array();
    for (const auto& tag : tags) {
        arr.push_back(TagToJson(tag));
    }
    m_persistence->writeAtomic(sessionPath(sessionId), arr.dump(2));
}

void FilePrivacyTagRepository::insert(const std::vector<domain::PrivacyTag>& tags) {
    if (tags.empty()) return;
    std::lock_guard<std::mutex> lock(m_mutex);

    std::map<std::string, std::vector<domain::PrivacyTag>> bySession;
    for (const auto& tag : tags) {
        bySession[tag.sessionId].push_back(tag);
    }

    json index = json::object();
    if (auto text = m_persistence->readText(indexPath())) {
        try {
            index = json::parse(*text);
        } catch (const json::exception& e) {
            throw domain::StorageError(std::string("Corrupted tag index: ") + e.what());
        }
    }

    for (auto& [sessionId, added] : bySession) {
        auto existing = loadSession(sessionId);
        for (const auto& tag : added) {
            existing.push_back(tag);
            index[tag.id] = sessionId;
        }
        saveSession(sessionId, existing);
    }
    m_persistence->writeAtomic(indexPath(), index.dump());
}

std::vector<domain::PrivacyTag> FilePrivacyTagRepository::findBySession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadSession(sessionId);
}

bool FilePrivacyTagRepository::updateStatus(const std::string& tagId, domain::TagStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto text = m_persistence->readText(indexPath());
    if (!text) return false;

    std::string sessionId;
    try {
        auto index = json::parse(*text);
        auto it = index.find(tagId);
        if (it == index.end()) return false;
        sessionId = it->get<std::string>();
    } catch (const json::exception& e) {
        throw domain::StorageError(std::string("Corrupted tag index: ") + e.what());
    }

    auto tags = loadSession(sessionId);
    for (auto& tag : tags) {
        if (tag.id == tagId) {
            tag.status = status;
            saveSession(sessionId, tags);
            return true;
        }
    }
    return false;
}

int FilePrivacyTagRepository::removeBySession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto tags = loadSession(sessionId);
    if (tags.empty()) return 0;

    if (auto text = m_persistence->readText(indexPath())) {
        try {
            auto index = json::parse(*text);
            for (const auto& tag : tags) {
                index.erase(tag.id);
            }
            m_persistence->writeAtomic(indexPath(), index.dump());
        } catch (const json::exception& e) {
            throw domain::StorageError(std::string("Corrupted tag index: ") + e.what());
        }
    }
    m_persistence->remove(sessionPath(sessionId));
    return static_cast<int>(tags.size());
}

} // namespace quietledger::infrastructure::storage
