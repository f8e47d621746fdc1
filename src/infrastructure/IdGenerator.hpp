// IdGenerator Header
#pragma once
#include <string>

namespace quietledger::infrastructure {

/** @brief Random 32-character hexadecimal identifier. Thread-safe. */
std::string GenerateId();

} // namespace quietledger::infrastructure
