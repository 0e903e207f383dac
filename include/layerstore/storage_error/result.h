// include/layerstore/storage_error/result.h
#pragma once

#include "storage_error.h"
#include <optional>
#include <stdexcept>
#include <utility>

namespace storage {

/**
 * @brief Either a value or the StorageError explaining why there is none.
 *
 * Used where failure is an expected outcome that callers branch on (parsing
 * a directory entry that may not be a layer file). Hard failures are thrown.
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::optional<StorageError> error_;

public:
    Result(T val) : value_(std::move(val)) {}
    Result(StorageError err) : error_(std::move(err)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool hasValue() const { return value_.has_value(); }
    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return hasValue(); }
    explicit operator bool() const { return isOk(); }

    const T& value() const& {
        if (!hasValue()) throw *error_;
        return *value_;
    }
    T& value() & {
        if (!hasValue()) throw *error_;
        return *value_;
    }
    T&& value() && {
        if (!hasValue()) throw *error_;
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Result has no error (const access)");
        return *error_;
    }
    StorageError& error() & {
        if (!hasError()) throw std::logic_error("Result has no error (non-const access)");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Result has no error (rvalue access)");
        return std::move(*error_);
    }

    T valueOr(T default_value) const& {
        return hasValue() ? *value_ : std::move(default_value);
    }
};

// Specialization for void
template<>
class Result<void> {
private:
    std::optional<StorageError> error_;

public:
    Result() = default; // Represents success
    Result(StorageError err) : error_(std::move(err)) {}

    bool hasError() const { return error_.has_value(); }
    bool isOk() const { return !hasError(); }
    explicit operator bool() const { return isOk(); }

    const StorageError& error() const& {
        if (!hasError()) throw std::logic_error("Result<void> has no error (const access)");
        return *error_;
    }
    StorageError&& error() && {
        if (!hasError()) throw std::logic_error("Result<void> has no error (rvalue access)");
        return std::move(*error_);
    }
};

// Operations that don't return a value but can fail
using Status = Result<void>;

} // namespace storage
