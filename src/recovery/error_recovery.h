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

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../cancellation.h"
#include "../diagnostics.h"
#include "../engine_config.h"
#include "../errors.h"
#include "memory_coordinator.h"

namespace textvault {

enum class RecoveryStrategy {
    Retry,                  // primary path, possibly after retries
    Fallback,               // a degraded alternative produced the value
    GracefulDegradation,    // nothing usable; caller should show a reduced view
    UserIntervention        // cancelled or needs a human decision
};

const char* to_string(RecoveryStrategy s);

/**
 * Outcome of a recovered operation. Degraded success is data, not an
 * exception.
 */
template<typename T>
struct RecoveryResult {
    bool success = false;
    RecoveryStrategy strategy_used = RecoveryStrategy::Retry;
    std::optional<T> result;
    std::optional<std::string> error_message;
    uint32_t attempts_used = 0;
    ErrorKind error_kind = ErrorKind::None;

    bool cancelled() const { return error_kind == ErrorKind::Cancelled; }

    static RecoveryResult ok(T value, RecoveryStrategy strategy, uint32_t attempts) {
        RecoveryResult r;
        r.success = true;
        r.strategy_used = strategy;
        r.result = std::move(value);
        r.attempts_used = attempts;
        return r;
    }

    static RecoveryResult fail(RecoveryStrategy strategy, const Error& error, uint32_t attempts) {
        RecoveryResult r;
        r.success = false;
        r.strategy_used = strategy;
        r.error_message = error.message;
        r.error_kind = error.kind == ErrorKind::None ? ErrorKind::IoFailure : error.kind;
        r.attempts_used = attempts;
        return r;
    }
};

/**
 * Retry, fallback and memory-pressure recovery around fallible operations.
 *
 * Operations receive the caller's CancellationToken and report failure by
 * throwing; classify_exception() decides whether another attempt is worth
 * making. Nothing here throws except for exceptions outside std::exception.
 */
class ErrorRecovery {
public:
    template<typename T>
    using Operation = std::function<T(const CancellationToken&)>;

    explicit ErrorRecovery(RecoveryConfig config = RecoveryConfig(),
                           std::shared_ptr<MemoryCoordinator> memory = nullptr,
                           EventSink* sink = nullptr);

    /**
     * Run `op` up to `max_attempts` times (0 means the configured default)
     * with exponential backoff between attempts.
     */
    template<typename T>
    RecoveryResult<T> execute_with_retry(const Operation<T>& op,
                                         const std::string& name,
                                         uint32_t max_attempts = 0,
                                         const CancellationToken& cancel = CancellationToken());

    /**
     * Retry `primary`; if it still fails, try progressively cheaper ways of
     * getting at least part of the file's text.
     */
    RecoveryResult<std::string> recover_file_read(const Operation<std::string>& primary,
                                                  const std::string& path,
                                                  const CancellationToken& cancel = CancellationToken());

    /**
     * Run `op` after a light collection. On std::bad_alloc collect
     * aggressively and try `fallback` (may be empty) once.
     */
    template<typename T>
    RecoveryResult<T> recover_memory_operation(const Operation<T>& op,
                                               const Operation<T>& fallback,
                                               const std::string& name,
                                               const CancellationToken& cancel = CancellationToken());

    /**
     * Delay before attempt `attempt + 1`:
     * min(base * 2^(attempt-1) + jitter, max), jitter in [0, jitter_fraction * scaled base).
     */
    std::chrono::milliseconds retry_delay(uint32_t attempt) const;

    // False for fatal kinds and cancellation.
    static bool should_retry(const Error& error);

    const RecoveryConfig& config() const { return config_; }
    MemoryCoordinator& memory() { return *memory_; }
    const std::shared_ptr<MemoryCoordinator>& memory_ptr() const { return memory_; }
    EventSink* sink() const { return sink_; }

    // Individual fallbacks, exposed for tests. Each throws on failure.
    std::string read_whole(const std::string& path, const CancellationToken& cancel) const;
    std::string read_chunked(const std::string& path, const CancellationToken& cancel) const;
    std::string read_head(const std::string& path, const CancellationToken& cancel) const;

    static constexpr const char* kTruncatedMarker =
        "\n\n[Content truncated - file too large for recovery mode]\n";

private:
    RecoveryConfig config_;
    std::shared_ptr<MemoryCoordinator> memory_;
    EventSink* sink_;
};

} // namespace textvault

#include "error_recovery.hpp"
