#include "infrastructure/storage/FileContentUnitRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/PrivacyErrors.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace quietledger::infrastructure::storage {

using json = nlohmann::json;
namespace fs = std::filesystem;

FileContentUnitRepository::FileContentUnitRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence)
    : m_storageRoot(std::move(storageRoot)), m_persistence(std::move(persistence)) {}

std::string FileContentUnitRepository::sessionDirectory(const std::string& sessionId) const {
    return (fs::path(m_storageRoot) / "cards" / PathUtils::EncodeFileName(sessionId)).string();
}

void FileContentUnitRepository::create(const domain::ContentUnit& unit) {
    if (unit.id.empty()) {
        throw domain::StorageError("Card id must not be empty.");
    }

    json j;
    j["id"] = unit.id;
    j["session_id"] = unit.sessionId;
    j["content"] = unit.content;
    j["pile"] = unit.pile;
    j["tag_type"] = unit.tagType;
    j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(unit.createdAt.time_since_epoch()).count();

    fs::path path = fs::path(sessionDirectory(unit.sessionId)) / (PathUtils::EncodeFileName(unit.id) + ".json");
    if (!m_persistence->writeExclusive(path.string(), j.dump(2))) {
        throw domain::StorageError("Card already exists: " + unit.id);
    }
}

std::vector<domain::ContentUnit> FileContentUnitRepository::findBySession(const std::string& sessionId) {
    std::vector<domain::ContentUnit> units;
    fs::path dir = sessionDirectory(sessionId);

    std::error_code ec;
    if (!fs::exists(dir, ec)) return units;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() != ".json") continue;

        auto text = m_persistence->readText(entry.path().string());
        if (!text) continue;

        try {
            auto j = json::parse(*text);
            domain::ContentUnit unit;
            unit.id = j.at("id").get<std::string>();
            unit.sessionId = j.at("session_id").get<std::string>();
            unit.content = j.at("content").get<std::string>();
            unit.pile = j.at("pile").get<std::string>();
            unit.tagType = j.value("tag_type", "brain_dump");
            unit.createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(j.value("ts", 0LL)));
            units.push_back(std::move(unit));
        } catch (const json::exception& e) {
            throw domain::StorageError("Corrupted card " + entry.path().string() + ": " + e.what());
        }
    }
    if (ec) {
        throw domain::StorageError("Cannot list cards of " + sessionId + ": " + ec.message());
    }

    std::sort(units.begin(), units.end(), [](const domain::ContentUnit& a, const domain::ContentUnit& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.id < b.id;
    });
    return units;
}

} // namespace quietledger::infrastructure::storage
