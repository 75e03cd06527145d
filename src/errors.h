/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace textvault {

enum class ErrorKind {
    None,
    InvalidInput,       // empty path, bad offsets, non-positive lengths
    NotFound,           // missing file or directory
    PermissionDenied,
    OutOfRange,         // position at or beyond end of file
    IoFailure,          // transient or persistent I/O error
    InsufficientSpace,
    MemoryExhausted,
    Cancelled
};

const char* to_string(ErrorKind kind);

/**
 * Thrown when a CancellationToken fires at a chunk boundary or during a
 * retry wait. Never retried.
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation was cancelled") {}
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    int code = 0;             // errno when the failure came from the OS
    std::string message;
};

// Map an errno value onto the taxonomy.
ErrorKind kind_from_errno(int err);

// Classify an in-flight exception. Must be called from a catch block or with
// a captured exception_ptr.
Error classify_exception(std::exception_ptr ep);

// Throw std::system_error for errno, prefixed with what was being done.
[[noreturn]] void throw_errno(int err, const std::string& what);

// Build an exception for a kind outside errno space (validation failures).
[[noreturn]] void throw_error(ErrorKind kind, const std::string& what);

/**
 * Value-or-error result returned by the public entry points.
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        if (r.error_.kind == ErrorKind::None) {
            r.error_.kind = ErrorKind::IoFailure;
        }
        return r;
    }

    static Result failure(ErrorKind kind, std::string message, int code = 0) {
        return failure(Error{kind, code, std::move(message)});
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.message);
        }
        return *value_;
    }
    T& value() & {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.message);
        }
        return *value_;
    }
    T&& value() && {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_.message);
        }
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    const T& operator*() const { return value(); }

    const Error& error() const { return error_; }
    ErrorKind kind() const { return ok() ? ErrorKind::None : error_.kind; }

private:
    std::optional<T> value_;
    Error error_;
};

template<>
class Result<void> {
public:
    static Result success() { return Result(); }

    static Result failure(Error error) {
        Result r;
        r.error_ = std::move(error);
        if (r.error_.kind == ErrorKind::None) {
            r.error_.kind = ErrorKind::IoFailure;
        }
        return r;
    }

    static Result failure(ErrorKind kind, std::string message, int code = 0) {
        return failure(Error{kind, code, std::move(message)});
    }

    bool ok() const { return error_.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    Error error_;
};

} // namespace textvault
