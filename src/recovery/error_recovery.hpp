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

#include "error_recovery.h"
#include "../util/log.h"

#include <cerrno>
#include <new>

namespace textvault {

    template<typename T>
    RecoveryResult<T> ErrorRecovery::execute_with_retry(const Operation<T>& op,
                                                        const std::string& name,
                                                        uint32_t max_attempts,
                                                        const CancellationToken& cancel) {
        if (max_attempts == 0) {
            max_attempts = config_.max_attempts;
        }

        Error last;
        for (uint32_t attempt = 1; attempt <= max_attempts; attempt++) {
            if (cancel.is_cancelled()) {
                return RecoveryResult<T>::fail(RecoveryStrategy::UserIntervention,
                                               Error{ErrorKind::Cancelled, 0, "Operation was cancelled"},
                                               attempt - 1);
            }

            try {
                T value = op(cancel);
                if (attempt > 1) {
                    report(sink_, ErrorCategory::FileIO, Severity::Info,
                           "Operation '" + name + "' succeeded after " + std::to_string(attempt) + " attempts");
                }
                return RecoveryResult<T>::ok(std::move(value), RecoveryStrategy::Retry, attempt);
            } catch (const std::exception&) {
                last = classify_exception(std::current_exception());
            }

            if (last.kind == ErrorKind::Cancelled) {
                return RecoveryResult<T>::fail(RecoveryStrategy::UserIntervention, last, attempt);
            }

            report(sink_, ErrorCategory::FileIO, Severity::Warning,
                   "Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                   " failed for '" + name + "': " + last.message);

            if (!should_retry(last)) {
                debug() << "'" << name << "' failed with non-retryable " << to_string(last.kind);
                return RecoveryResult<T>::fail(RecoveryStrategy::Retry, last, attempt);
            }

            if (attempt == max_attempts) {
                break;
            }

            std::chrono::milliseconds delay = retry_delay(attempt);
            debug() << "Retrying '" << name << "' in " << static_cast<long long>(delay.count()) << "ms";
            if (cancel.wait_for(delay)) {
                return RecoveryResult<T>::fail(RecoveryStrategy::UserIntervention,
                                               Error{ErrorKind::Cancelled, 0, "Operation was cancelled"},
                                               attempt);
            }
        }

        return RecoveryResult<T>::fail(RecoveryStrategy::Retry, last, max_attempts);
    }

    template<typename T>
    RecoveryResult<T> ErrorRecovery::recover_memory_operation(const Operation<T>& op,
                                                              const Operation<T>& fallback,
                                                              const std::string& name,
                                                              const CancellationToken& cancel) {
        try {
            memory_->collect(false);
            return RecoveryResult<T>::ok(op(cancel), RecoveryStrategy::Retry, 1);
        } catch (const std::bad_alloc&) {
            // handled below
        } catch (const std::exception&) {
            Error e = classify_exception(std::current_exception());
            if (e.kind != ErrorKind::MemoryExhausted) {
                if (e.kind != ErrorKind::Cancelled) {
                    report(sink_, ErrorCategory::Memory, Severity::Error,
                           "Memory operation failed: " + name, std::current_exception());
                }
                return RecoveryResult<T>::fail(RecoveryStrategy::UserIntervention, e, 1);
            }
        }

        // out of memory from here on
        report(sink_, ErrorCategory::Memory, Severity::Error,
               "Out of memory during '" + name + "'");

        if (fallback) {
            try {
                memory_->collect(true);
                return RecoveryResult<T>::ok(fallback(cancel), RecoveryStrategy::Fallback, 2);
            } catch (const std::exception&) {
                Error e = classify_exception(std::current_exception());
                if (e.kind == ErrorKind::Cancelled) {
                    return RecoveryResult<T>::fail(RecoveryStrategy::UserIntervention, e, 2);
                }
                report(sink_, ErrorCategory::Memory, Severity::Error,
                       name + " (fallback)", std::current_exception());
            }
        } else {
            memory_->collect(true);
        }

        return RecoveryResult<T>::fail(RecoveryStrategy::GracefulDegradation,
                                       Error{ErrorKind::MemoryExhausted, ENOMEM,
                                             "Insufficient memory to complete operation"},
                                       fallback ? 2 : 1);
    }

}
