/**
 * @file ContentUnit.hpp
 * @brief A card produced from reviewed dictation.
 */

#pragma once

#include <string>
#include <chrono>

namespace quietledger::domain {

namespace card_pile {
inline const std::string Inbox = "inbox";
inline const std::string Vault = "vault";
} // namespace card_pile

struct ContentUnit {
    std::string id;
    std::string sessionId;
    std::string content;
    std::string pile;                     ///< "inbox" for public, "vault" for private.
    std::string tagType = "brain_dump";
    std::chrono::system_clock::time_point createdAt;
};

} // namespace quietledger::domain
