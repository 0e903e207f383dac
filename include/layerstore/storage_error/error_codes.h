// include/layerstore/storage_error/error_codes.h
#pragma once

namespace storage {

/**
 * @brief Error codes for layer file storage operations
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Storage Errors (1000-1999)
    STORAGE_CORRUPTION = 1001,
    STORAGE_VERSION_MISMATCH = 1002,
    STORAGE_NOT_INITIALIZED = 1003,

    // Layer Specific Errors (2000-2999)
    LAYER_SUMMARY_MISMATCH = 2001,
    LAYER_KEY_OUT_OF_RANGE = 2002,
    LAYER_WRITER_CLOSED = 2003,

    // B-Tree Specific Errors (3000-3999)
    BTREE_NODE_CORRUPTION = 3001,
    BTREE_HEIGHT_EXCEEDED = 3002,
    BTREE_KEY_TOO_LARGE = 3003,

    // I/O and File System Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    IO_SEEK_ERROR = 4003,
    IO_FLUSH_ERROR = 4004,
    FILE_NOT_FOUND = 4005,

    // Data Validation Errors (5000-5999)
    INVALID_KEY = 5001,
    INVALID_VALUE = 5002,
    INVALID_DATA_FORMAT = 5004,
    COMPRESSION_ERROR = 5006,

    // Memory Errors (7000-7999)
    OUT_OF_MEMORY = 7001,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,

    // Generic Errors (10000+)
    INTERNAL_ERROR = 10002,
    UNKNOWN_ERROR = 10003
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Warning, operation succeeded but with issues
    ERROR,      // Error, operation failed but system is stable
    CRITICAL,   // Critical error, system stability may be compromised
    FATAL       // Fatal error, immediate shutdown required
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    STORAGE,
    LAYER,
    BTREE,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    MEMORY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
