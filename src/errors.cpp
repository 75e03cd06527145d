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

#include "errors.h"

#include <cerrno>
#include <filesystem>
#include <ios>
#include <new>

namespace textvault {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::InvalidInput:      return "InvalidInput";
        case ErrorKind::NotFound:          return "NotFound";
        case ErrorKind::PermissionDenied:  return "PermissionDenied";
        case ErrorKind::OutOfRange:        return "OutOfRange";
        case ErrorKind::IoFailure:         return "IoFailure";
        case ErrorKind::InsufficientSpace: return "InsufficientSpace";
        case ErrorKind::MemoryExhausted:   return "MemoryExhausted";
        case ErrorKind::Cancelled:         return "Cancelled";
    }
    return "Unknown";
}

ErrorKind kind_from_errno(int err) {
    switch (err) {
        case 0:
            return ErrorKind::None;
        case ENOENT:
        case ENOTDIR:
            return ErrorKind::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::PermissionDenied;
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
        case EFBIG:
            return ErrorKind::InsufficientSpace;
        case ENOMEM:
            return ErrorKind::MemoryExhausted;
        case EINVAL:
        case EISDIR:
        case ENAMETOOLONG:
            return ErrorKind::InvalidInput;
        case ECANCELED:
            return ErrorKind::Cancelled;
        default:
            return ErrorKind::IoFailure;
    }
}

Error classify_exception(std::exception_ptr ep) {
    if (!ep) {
        return Error{};
    }
    try {
        std::rethrow_exception(ep);
    } catch (const OperationCancelled& e) {
        return Error{ErrorKind::Cancelled, ECANCELED, e.what()};
    } catch (const std::bad_alloc& e) {
        return Error{ErrorKind::MemoryExhausted, ENOMEM, e.what()};
    } catch (const std::length_error& e) {
        // allocation request beyond max_size()
        return Error{ErrorKind::MemoryExhausted, ENOMEM, e.what()};
    } catch (const std::invalid_argument& e) {
        return Error{ErrorKind::InvalidInput, EINVAL, e.what()};
    } catch (const std::out_of_range& e) {
        return Error{ErrorKind::OutOfRange, 0, e.what()};
    } catch (const std::system_error& e) {
        const std::error_code& ec = e.code();
        if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
            return Error{kind_from_errno(ec.value()), ec.value(), e.what()};
        }
        // iostream_category and friends carry no errno
        return Error{ErrorKind::IoFailure, 0, e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorKind::IoFailure, 0, e.what()};
    } catch (...) {
        return Error{ErrorKind::IoFailure, 0, "unknown exception"};
    }
}

void throw_errno(int err, const std::string& what) {
    throw std::system_error(err, std::generic_category(), what);
}

void throw_error(ErrorKind kind, const std::string& what) {
    switch (kind) {
        case ErrorKind::InvalidInput:
            throw std::invalid_argument(what);
        case ErrorKind::OutOfRange:
            throw std::out_of_range(what);
        case ErrorKind::MemoryExhausted:
            throw std::bad_alloc();
        case ErrorKind::Cancelled:
            throw OperationCancelled(what);
        case ErrorKind::NotFound:
            throw_errno(ENOENT, what);
        case ErrorKind::PermissionDenied:
            throw_errno(EACCES, what);
        case ErrorKind::InsufficientSpace:
            throw_errno(ENOSPC, what);
        case ErrorKind::IoFailure:
        case ErrorKind::None:
            break;
    }
    throw_errno(EIO, what);
}

} // namespace textvault
