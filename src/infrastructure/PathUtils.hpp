// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace quietledger::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();

    /** @brief Default storage root: <data home>/QuietLedger. */
    static std::filesystem::path GetDefaultStorageRoot();

    /** @brief Turns an arbitrary identifier into a safe, reversible file name. */
    static std::string EncodeFileName(const std::string& id);
    static std::string DecodeFileName(const std::string& name);
};

} // namespace quietledger::infrastructure
