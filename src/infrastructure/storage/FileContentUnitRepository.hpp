/**
 * @file FileContentUnitRepository.hpp
 * @brief Cards stored as one JSON file each.
 */

#pragma once

#include <string>
#include <memory>
#include "domain/repositories/ContentUnitRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace quietledger::infrastructure::storage {

/// Structure: <root>/cards/<session>/<card>.json
class FileContentUnitRepository : public domain::ContentUnitRepository {
public:
    FileContentUnitRepository(std::string storageRoot, std::shared_ptr<PersistenceService> persistence);

    void create(const domain::ContentUnit& unit) override;
    std::vector<domain::ContentUnit> findBySession(const std::string& sessionId) override;

private:
    std::string sessionDirectory(const std::string& sessionId) const;

    std::string m_storageRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace quietledger::infrastructure::storage
