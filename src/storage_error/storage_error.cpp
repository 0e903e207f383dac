// src/storage_error/storage_error.cpp
#include "layerstore/storage_error/storage_error.h"
#include "layerstore/storage_error/error_utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->line_number = line;
    this->function_name = function;
    this->context["source"] = file + ":" + std::to_string(line);
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

bool StorageError::isRecoverable() const {
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}

bool StorageError::requiresShutdown() const {
    return severity == ErrorSeverity::FATAL;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (file_path) {
        oss << " [file: " << *file_path << "]";
    }
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path) {
        oss << "  File Path: " << *file_path << "\n";
    }
    if (function_name) {
        oss << "  Function: " << *function_name << "\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    auto time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "\n";

    return oss.str();
}

// Static factory methods
StorageError StorageError::corruption(const std::string& details_param) {
    return StorageError(ErrorCode::STORAGE_CORRUPTION, "Storage corruption detected")
        .withDetails(details_param)
        .withSuggestedAction("Remove the layer file and let it be regenerated");
}

StorageError StorageError::ioError(const std::string& operation, const std::string& path) {
    return StorageError(ErrorCode::IO_READ_ERROR, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

StorageError StorageError::fileNotFound(const std::string& path) {
    return StorageError(ErrorCode::FILE_NOT_FOUND, "File not found")
        .withFilePath(path);
}

} // namespace storage
