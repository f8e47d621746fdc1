/**
 * @file ContentUnitRepository.hpp
 * @brief Storage interface for cards materialized from reviewed sentences.
 */

#pragma once

#include <vector>
#include <string>
#include "domain/ContentUnit.hpp"

namespace quietledger::domain {

class ContentUnitRepository {
public:
    virtual ~ContentUnitRepository() = default;

    /** @brief Persists a new card. Throws StorageError on failure. */
    virtual void create(const ContentUnit& unit) = 0;

    virtual std::vector<ContentUnit> findBySession(const std::string& sessionId) = 0;
};

} // namespace quietledger::domain
