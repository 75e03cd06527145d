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

#include "error_recovery.h"
#include "../persistence/file_handle.h"
#include "../util/log.h"
#include "../util/text_codec.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <random>
#include <vector>

namespace textvault {

const char* to_string(RecoveryStrategy s) {
    switch (s) {
        case RecoveryStrategy::Retry:               return "Retry";
        case RecoveryStrategy::Fallback:            return "Fallback";
        case RecoveryStrategy::GracefulDegradation: return "GracefulDegradation";
        case RecoveryStrategy::UserIntervention:    return "UserIntervention";
    }
    return "Unknown";
}

ErrorRecovery::ErrorRecovery(RecoveryConfig config,
                             std::shared_ptr<MemoryCoordinator> memory,
                             EventSink* sink)
    : config_(std::move(config)),
      memory_(memory ? std::move(memory) : std::make_shared<MemoryCoordinator>()),
      sink_(sink) {
    if (!config_.validate()) {
        throw std::invalid_argument("ErrorRecovery: invalid recovery configuration");
    }
}

std::chrono::milliseconds ErrorRecovery::retry_delay(uint32_t attempt) const {
    if (attempt == 0) {
        attempt = 1;
    }

    const double base = static_cast<double>(config_.base_delay.count());
    const double cap = static_cast<double>(config_.max_delay.count());

    // cap the exponent well before it overflows a double
    double scaled = base * std::pow(2.0, static_cast<double>(std::min<uint32_t>(attempt - 1, 30)));

    double jitter = 0.0;
    double jitter_span = scaled * config_.jitter_fraction;
    if (jitter_span >= 1.0) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(0.0, jitter_span);
        jitter = std::floor(dist(rng));
    }

    double delay = std::min(scaled + jitter, cap);
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool ErrorRecovery::should_retry(const Error& error) {
    switch (error.kind) {
        case ErrorKind::None:
        case ErrorKind::PermissionDenied:
        case ErrorKind::NotFound:
        case ErrorKind::InvalidInput:
        case ErrorKind::OutOfRange:
        case ErrorKind::MemoryExhausted:
        case ErrorKind::InsufficientSpace:
        case ErrorKind::Cancelled:
            return false;
        case ErrorKind::IoFailure:
            break;
    }

    switch (error.code) {
        case 0:              // no structured code: retry, as for any unknown I/O error
        case EBUSY:
        case ETXTBSY:
        case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EINTR:
        case EIO:
        case ETIMEDOUT:
        case ENETDOWN:
        case ENETUNREACH:
        case ENETRESET:
        case ECONNRESET:
        case ECONNABORTED:
        case EHOSTUNREACH:
#ifdef ESTALE
        case ESTALE:
#endif
        case ENOLCK:
        case EDEADLK:
            return true;
        default:
            return false;
    }
}

// ---------------------------------------------------------------------------
// Degraded reads
// ---------------------------------------------------------------------------

namespace {

    std::string decode_for_display(const std::string& raw, bool at_file_start) {
        size_t skip = 0;
        if (at_file_start && text::detect_encoding(raw.data(), raw.size()) == text::Encoding::Utf8Bom) {
            skip = text::kUtf8BomSize;
        }
        std::string decoded = text::decode_utf8(raw.data() + skip, raw.size() - skip);
        return text::normalize_line_endings(decoded);
    }

} // namespace

std::string ErrorRecovery::read_whole(const std::string& path, const CancellationToken& cancel) const {
    persist::FileHandle fh = persist::FileHandle::open_read(path);
    uint64_t size = fh.size();

    std::string raw;
    raw.resize(static_cast<size_t>(size));
    size_t n = fh.read_at(&raw[0], raw.size(), 0, cancel);
    raw.resize(n);

    return decode_for_display(raw, true);
}

std::string ErrorRecovery::read_chunked(const std::string& path, const CancellationToken& cancel) const {
    persist::FileHandle fh = persist::FileHandle::open_read(path);

    std::vector<char> buf(config_.fallback_chunk_size);
    std::string content;
    std::string carry;
    uint64_t offset = 0;
    bool first = true;

    for (;;) {
        cancel.throw_if_cancelled();

        size_t n = fh.read_at(buf.data(), buf.size(), offset, cancel);
        if (n == 0) {
            break;
        }
        offset += n;

        carry.append(buf.data(), n);
        size_t cut = text::utf8_safe_boundary(carry.data(), carry.size());
        // hold a trailing CR back so a CRLF pair split across reads stays one line break
        if (cut > 0 && carry[cut - 1] == '\r') {
            --cut;
        }
        std::string piece = carry.substr(0, cut);
        carry.erase(0, cut);

        content.append(decode_for_display(piece, first));
        first = false;

        if (content.size() > config_.fallback_content_cap) {
            content.append(kTruncatedMarker);
            return content;
        }
    }

    if (!carry.empty()) {
        content.append(decode_for_display(carry, first));
    }
    return content;
}

std::string ErrorRecovery::read_head(const std::string& path, const CancellationToken& cancel) const {
    persist::FileHandle fh = persist::FileHandle::open_read(path);
    uint64_t size = fh.size();

    size_t want = static_cast<size_t>(std::min<uint64_t>(size, config_.head_only_bytes));
    std::string raw;
    raw.resize(want);
    size_t n = fh.read_at(&raw[0], want, 0, cancel);
    raw.resize(n);

    std::string content = decode_for_display(raw, true);
    if (size > config_.head_only_bytes) {
        content += "\n\n[Showing first " + std::to_string(n / 1024) + "KB of " +
                   std::to_string(size / 1024) + "KB file]";
    }
    return content;
}

RecoveryResult<std::string> ErrorRecovery::recover_file_read(const Operation<std::string>& primary,
                                                             const std::string& path,
                                                             const CancellationToken& cancel) {
    RecoveryResult<std::string> first = execute_with_retry<std::string>(primary, "read " + path, 0, cancel);
    if (first.success || first.strategy_used == RecoveryStrategy::UserIntervention) {
        return first;
    }

    warning() << "Primary read of " << path << " failed (" << first.error_message.value_or("")
              << "), trying fallbacks";

    typedef std::string (ErrorRecovery::*Fallback)(const std::string&, const CancellationToken&) const;
    static const Fallback fallbacks[] = {
        &ErrorRecovery::read_whole,
        &ErrorRecovery::read_chunked,
        &ErrorRecovery::read_head
    };
    static const char* names[] = { "whole-file", "chunked", "head-only" };

    uint32_t attempts = 0;
    for (size_t i = 0; i < sizeof(fallbacks) / sizeof(fallbacks[0]); i++) {
        attempts++;
        try {
            std::string content = (this->*fallbacks[i])(path, cancel);
            if (!content.empty()) {
                info() << "Recovered " << path << " using " << names[i] << " fallback";
                return RecoveryResult<std::string>::ok(std::move(content), RecoveryStrategy::Fallback, attempts);
            }
            debug() << names[i] << " fallback returned no content for " << path;
        } catch (const std::exception&) {
            Error e = classify_exception(std::current_exception());
            if (e.kind == ErrorKind::Cancelled) {
                return RecoveryResult<std::string>::fail(RecoveryStrategy::UserIntervention, e, attempts);
            }
            report(sink_, ErrorCategory::FileIO, Severity::Warning,
                   std::string("read (") + names[i] + " fallback) failed", std::current_exception(), path);
        }
    }

    return RecoveryResult<std::string>::fail(RecoveryStrategy::GracefulDegradation,
                                             Error{ErrorKind::IoFailure, 0, "All file access methods failed"},
                                             attempts);
}

} // namespace textvault
