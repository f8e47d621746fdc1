/**
 * @file StripedLocks.hpp
 * @brief Fixed pool of mutexes selected by key hash.
 */

#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <string>

namespace quietledger::application {

/**
 * @class StripedLocks
 * @brief Serializes work per key with constant memory.
 *
 * Equal keys always map to the same mutex. Distinct keys may share one,
 * which only costs parallelism.
 */
class StripedLocks {
public:
    static constexpr size_t kStripeCount = 64;

    std::mutex& forKey(const std::string& key) {
        return m_stripes[std::hash<std::string>{}(key) % kStripeCount];
    }

    size_t stripeCount() const { return m_stripes.size(); }

private:
    std::array<std::mutex, kStripeCount> m_stripes;
};

} // namespace quietledger::application
