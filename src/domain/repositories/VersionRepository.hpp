/**
 * @file VersionRepository.hpp
 * @brief Storage interface for the append-only version log.
 */

#pragma once

#include <vector>
#include <optional>
#include <string>
#include "domain/DocumentVersion.hpp"

namespace quietledger::domain {

/**
 * @class VersionRepository
 * @brief Append-only log keyed by (documentId, versionNumber).
 *
 * All methods throw StorageError on persistence failure.
 */
class VersionRepository {
public:
    virtual ~VersionRepository() = default;

    /**
     * @brief Appends a version.
     * @throws DuplicateVersion if the (documentId, versionNumber) pair already exists.
     */
    virtual void append(const DocumentVersion& version) = 0;

    /** @brief All versions of a document, in no particular order. */
    virtual std::vector<DocumentVersion> findByDocument(const std::string& documentId) = 0;

    /** @brief Highest stored version number, or nullopt if the document has none. */
    virtual std::optional<int> maxVersionNumber(const std::string& documentId) = 0;

    /** @brief Replaces the denormalized current content of a document. */
    virtual void setCurrentContent(const std::string& documentId, int versionNumber, const std::string& content) = 0;

    virtual std::optional<CurrentContent> getCurrentContent(const std::string& documentId) = 0;
};

} // namespace quietledger::domain
