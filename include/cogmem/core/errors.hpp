#pragma once

#include <stdexcept>
#include <string>

namespace cogmem {

// ============================================================================
// Error Taxonomy
// ============================================================================

/**
 * @brief Base class for all recoverable engine errors
 */
class CogmemError : public std::runtime_error {
public:
    explicit CogmemError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed Event or View fields. Never retried, never stored.
 */
class ValidationError : public CogmemError {
public:
    explicit ValidationError(const std::string& message)
        : CogmemError("Validation error: " + message) {}
};

/**
 * @brief Inference boundary unavailable or returned unparseable output
 */
class ExtractionFailure : public CogmemError {
public:
    explicit ExtractionFailure(const std::string& message)
        : CogmemError("Extraction failure: " + message) {}
};

/**
 * @brief Consumer attempted an operation above its access level
 */
class PermissionDenied : public CogmemError {
public:
    explicit PermissionDenied(const std::string& message)
        : CogmemError("Permission denied: " + message) {}
};

/**
 * @brief Transient storage failure (busy, locked, I/O)
 */
class StorageUnavailable : public CogmemError {
public:
    explicit StorageUnavailable(const std::string& message)
        : CogmemError("Storage unavailable: " + message) {}
};

} // namespace cogmem
