// include/layerstore/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h"
#include "result.h"

#include <string>
#include <string_view>

namespace storage {
namespace error_utils {

    // Convert error code to string
    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    // Get error metadata
    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    // Error code predicates
    bool isLayerError(ErrorCode code);
    bool isBtreeError(ErrorCode code);
    bool isIoError(ErrorCode code);
    bool isRecoverable(ErrorCode code); // Checks severity
    bool isCritical(ErrorCode code);    // Checks severity

} // namespace error_utils

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

} // namespace storage
