// include/layerstore/storage_error/storage_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <map>

namespace storage {

/**
 * @brief Detailed error information with context
 *
 * Thrown by value. Context entries (path, offset, block number, expected vs.
 * actual values) are what make a corruption report actionable, so I/O and
 * format errors should always carry them.
 */
class StorageError {
public:
    ErrorCode code;
    ErrorSeverity severity; // Set based on code
    ErrorCategory category; // Set based on code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, std::string> context;

    // Constructors
    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    // Utility methods
    bool isRecoverable() const;
    bool requiresShutdown() const;
    std::string toString() const;
    std::string toDetailedString() const;

    // Static factory methods for common errors
    static StorageError corruption(const std::string& details);
    static StorageError ioError(const std::string& operation, const std::string& path);
    static StorageError fileNotFound(const std::string& path);
};

} // namespace storage
