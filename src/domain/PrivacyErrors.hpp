/**
 * @file PrivacyErrors.hpp
 * @brief Error taxonomy of the privacy core.
 *
 * Detection errors are always recovered inside the detector. Ledger and state
 * store errors are propagated to the caller.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace quietledger::domain {

/// A detection pattern could not be compiled. Skipped and logged.
class DetectionError : public std::runtime_error {
public:
    DetectionError(const std::string& patternName, const std::string& detail)
        : std::runtime_error("Pattern '" + patternName + "' failed to compile: " + detail),
          m_patternName(patternName) {}

    const std::string& patternName() const { return m_patternName; }

private:
    std::string m_patternName;
};

/// The external classifier did not produce a usable answer.
class ClassifierUnavailable : public std::runtime_error {
public:
    explicit ClassifierUnavailable(const std::string& reason)
        : std::runtime_error("Classifier unavailable: " + reason) {}
};

/// Restore requested a version that does not exist for the document.
class VersionNotFound : public std::runtime_error {
public:
    VersionNotFound(const std::string& documentId, int versionNumber)
        : std::runtime_error("version not found: " + documentId + " v" + std::to_string(versionNumber)),
          m_documentId(documentId), m_versionNumber(versionNumber) {}

    const std::string& documentId() const { return m_documentId; }
    int versionNumber() const { return m_versionNumber; }

private:
    std::string m_documentId;
    int m_versionNumber;
};

/// Any persistence failure.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/// The storage layer refused a second record for an existing (documentId, versionNumber).
class DuplicateVersion : public StorageError {
public:
    DuplicateVersion(const std::string& documentId, int versionNumber)
        : StorageError("Version " + std::to_string(versionNumber) + " already exists for " + documentId) {}
};

} // namespace quietledger::domain
