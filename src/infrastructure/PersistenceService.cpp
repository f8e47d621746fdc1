/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/PrivacyErrors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>

namespace quietledger::infrastructure {

namespace fs = std::filesystem;

std::string PersistenceService::writeTemp(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("Cannot create directory " + finalPath.parent_path().string() + ": " + ec.message());
        }
    }

    // Unique per operation: filename.<timestamp>.<thread>.<counter>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto thread = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(thread) + "." +
                std::to_string(m_tempCounter++) + ".tmp";

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::StorageError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageError("Write failed during output: " + tempPath.string());
        }
    } // Close happens here automatically

    return tempPath.string();
}

void PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    std::string tempPath = writeTemp(filename, content);

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, filename, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        throw domain::StorageError("Cannot write " + filename + ": " + ec.message());
    }
}

bool PersistenceService::writeExclusive(const std::string& filename, const std::string& content) {
    std::string tempPath = writeTemp(filename, content);

    // Linking fails if the target exists, which makes creation exclusive.
    std::error_code ec;
    fs::create_hard_link(tempPath, filename, ec);

    std::error_code cleanup;
    fs::remove(tempPath, cleanup);

    if (!ec) {
        return true;
    }
    if (ec == std::errc::file_exists) {
        return false;
    }
    std::cerr << "[PersistenceService] Exclusive create failed: " << ec.message() << std::endl;
    throw domain::StorageError("Cannot create " + filename + ": " + ec.message());
}

std::optional<std::string> PersistenceService::readText(const std::string& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        if (ec) {
            throw domain::StorageError("Cannot stat " + filename + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw domain::StorageError("Cannot open " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void PersistenceService::remove(const std::string& filename) {
    std::error_code ec;
    fs::remove(filename, ec);
    if (ec) {
        throw domain::StorageError("Cannot remove " + filename + ": " + ec.message());
    }
}

} // namespace quietledger::infrastructure
