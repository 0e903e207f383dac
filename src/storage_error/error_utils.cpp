// src/storage_error/error_utils.cpp
#include "layerstore/storage_error/error_utils.h"

namespace storage {
namespace error_utils {

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        // Storage Errors
        case ErrorCode::STORAGE_CORRUPTION: return "STORAGE_CORRUPTION";
        case ErrorCode::STORAGE_VERSION_MISMATCH: return "STORAGE_VERSION_MISMATCH";
        case ErrorCode::STORAGE_NOT_INITIALIZED: return "STORAGE_NOT_INITIALIZED";

        // Layer Errors
        case ErrorCode::LAYER_SUMMARY_MISMATCH: return "LAYER_SUMMARY_MISMATCH";
        case ErrorCode::LAYER_KEY_OUT_OF_RANGE: return "LAYER_KEY_OUT_OF_RANGE";
        case ErrorCode::LAYER_WRITER_CLOSED: return "LAYER_WRITER_CLOSED";

        // B-Tree Errors
        case ErrorCode::BTREE_NODE_CORRUPTION: return "BTREE_NODE_CORRUPTION";
        case ErrorCode::BTREE_HEIGHT_EXCEEDED: return "BTREE_HEIGHT_EXCEEDED";
        case ErrorCode::BTREE_KEY_TOO_LARGE: return "BTREE_KEY_TOO_LARGE";

        // I/O Errors
        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::IO_SEEK_ERROR: return "IO_SEEK_ERROR";
        case ErrorCode::IO_FLUSH_ERROR: return "IO_FLUSH_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";

        // Data Validation Errors
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";

        // Memory Errors
        case ErrorCode::OUT_OF_MEMORY: return "OUT_OF_MEMORY";

        // Configuration Errors
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        // Generic Errors
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";

        default: return "UNKNOWN_ERROR_CODE_DETAIL";
    }
}

std::string_view severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN_SEVERITY";
    }
}

std::string_view categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::STORAGE: return "STORAGE";
        case ErrorCategory::LAYER: return "LAYER";
        case ErrorCategory::BTREE: return "BTREE";
        case ErrorCategory::IO_FILESYSTEM: return "IO_FILESYSTEM";
        case ErrorCategory::DATA_VALIDATION: return "DATA_VALIDATION";
        case ErrorCategory::MEMORY: return "MEMORY";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::GENERIC: return "GENERIC";
        default: return "UNKNOWN_CATEGORY";
    }
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        // A corrupt layer file will not fix itself by retrying.
        case ErrorCode::STORAGE_CORRUPTION:
        case ErrorCode::BTREE_NODE_CORRUPTION:
            return ErrorSeverity::FATAL;

        case ErrorCode::OUT_OF_MEMORY:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::IO_SEEK_ERROR:
        case ErrorCode::IO_FLUSH_ERROR:
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::INVALID_DATA_FORMAT:
        case ErrorCode::STORAGE_VERSION_MISMATCH:
        case ErrorCode::LAYER_SUMMARY_MISMATCH:
        case ErrorCode::COMPRESSION_ERROR:
        case ErrorCode::INVALID_CONFIGURATION:
            return ErrorSeverity::ERROR;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::STORAGE;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::LAYER;
    } else if (code_value >= 3000 && code_value < 4000) {
        return ErrorCategory::BTREE;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 7000 && code_value < 8000) {
        return ErrorCategory::MEMORY;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

// Predicates
bool isLayerError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::LAYER; }
bool isBtreeError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::BTREE; }
bool isIoError(ErrorCode code) { return getErrorCategory(code) == ErrorCategory::IO_FILESYSTEM; }
bool isRecoverable(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity != ErrorSeverity::FATAL && severity != ErrorSeverity::CRITICAL;
}
bool isCritical(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity == ErrorSeverity::CRITICAL || severity == ErrorSeverity::FATAL;
}

} // namespace error_utils
} // namespace storage
