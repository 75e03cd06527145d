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
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults
#include "util/log.h"

namespace textvault {

/**
 * Retry/backoff and degraded-read limits.
 */
struct RecoveryConfig {
    uint32_t max_attempts        = recovery::kMaxRetryAttempts;
    std::chrono::milliseconds base_delay{recovery::kBaseRetryDelayMs};
    std::chrono::milliseconds max_delay{recovery::kMaxRetryDelayMs};
    double jitter_fraction       = recovery::kJitterFraction;
    size_t fallback_chunk_size   = recovery::kFallbackChunkSize;
    size_t fallback_content_cap  = recovery::kFallbackContentCap;
    size_t head_only_bytes       = recovery::kHeadOnlyBytes;

    bool validate() const {
        return max_attempts >= 1 &&
               base_delay.count() >= 0 &&
               max_delay >= base_delay &&
               jitter_fraction >= 0.0 && jitter_fraction <= 1.0 &&
               fallback_chunk_size > 0 &&
               fallback_content_cap > 0 &&
               head_only_bytes > 0;
    }
};

struct WriterConfig {
    size_t flush_every_lines     = writer::kFlushEveryLines;
    size_t progress_every_lines  = writer::kProgressEveryLines;
    uint64_t space_factor_required    = writer::kSpaceFactorRequired;
    uint64_t space_factor_comfortable = writer::kSpaceFactorComfortable;
    bool keep_backup             = false;   // leave <path>.backup behind after a successful save

    bool validate() const {
        return flush_every_lines > 0 &&
               progress_every_lines > 0 &&
               space_factor_comfortable >= space_factor_required;
    }
};

/**
 * Runtime configuration for one engine instance.
 * Compile-time defaults live in config.h; environment overrides are applied
 * by defaults().
 */
struct EngineConfig {
    size_t chunk_size            = streaming::kDefaultChunkSize;
    size_t cache_capacity        = cache::kDefaultCapacity;
    uint64_t streaming_threshold = analyzer::kStreamingThreshold;
    uint64_t safety_threshold    = analyzer::kSafetyThreshold;
    uint64_t large_threshold     = analyzer::kLargeCategoryThreshold;
    size_t sample_size           = analyzer::kSampleSize;
    uint64_t max_segment_request = streaming::kMaxSegmentRequest;

    RecoveryConfig recovery;
    WriterConfig writer;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static EngineConfig defaults() {
        EngineConfig cfg;

        if (const char* env = std::getenv("TEXTVAULT_CHUNK_SIZE")) {
            cfg.chunk_size = parse_size("TEXTVAULT_CHUNK_SIZE", env, cfg.chunk_size);
        }

        if (const char* env = std::getenv("TEXTVAULT_CACHE_CAPACITY")) {
            cfg.cache_capacity = parse_size("TEXTVAULT_CACHE_CAPACITY", env, cfg.cache_capacity);
        }

        if (const char* env = std::getenv("TEXTVAULT_STREAMING_THRESHOLD")) {
            cfg.streaming_threshold = parse_size("TEXTVAULT_STREAMING_THRESHOLD", env, cfg.streaming_threshold);
        }

        if (const char* env = std::getenv("TEXTVAULT_SAFETY_THRESHOLD")) {
            cfg.safety_threshold = parse_size("TEXTVAULT_SAFETY_THRESHOLD", env, cfg.safety_threshold);
        }

        if (const char* env = std::getenv("TEXTVAULT_RETRY_ATTEMPTS")) {
            cfg.recovery.max_attempts =
                static_cast<uint32_t>(parse_size("TEXTVAULT_RETRY_ATTEMPTS", env, cfg.recovery.max_attempts));
        }

        if (const char* env = std::getenv("TEXTVAULT_RETRY_BASE_MS")) {
            cfg.recovery.base_delay = std::chrono::milliseconds(
                parse_size("TEXTVAULT_RETRY_BASE_MS", env, static_cast<uint64_t>(cfg.recovery.base_delay.count())));
        }

        if (const char* env = std::getenv("TEXTVAULT_RETRY_MAX_MS")) {
            cfg.recovery.max_delay = std::chrono::milliseconds(
                parse_size("TEXTVAULT_RETRY_MAX_MS", env, static_cast<uint64_t>(cfg.recovery.max_delay.count())));
        }

        return cfg;
    }

    /**
     * Smaller chunks and cache for memory-constrained hosts
     */
    static EngineConfig low_memory() {
        EngineConfig cfg;
        cfg.chunk_size = 4 * 1024;
        cfg.cache_capacity = 4;
        cfg.streaming_threshold = 10ULL * 1024 * 1024;
        cfg.recovery.fallback_content_cap = 16ULL * 1024 * 1024;
        cfg.recovery.head_only_bytes = 2ULL * 1024 * 1024;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (chunk_size == 0 || cache_capacity == 0 || sample_size == 0) {
            return false;
        }
        if (streaming_threshold > safety_threshold) {
            // Streaming must kick in before the safety warning
            return false;
        }
        return recovery.validate() && writer.validate();
    }

private:
    static uint64_t parse_size(const char* name, const char* text, uint64_t fallback) {
        char* end = nullptr;
        unsigned long long v = std::strtoull(text, &end, 10);
        if (end == text || *end != '\0') {
            warning() << "Ignoring " << name << "='" << text << "', not a number; using " << fallback;
            return fallback;
        }
        return static_cast<uint64_t>(v);
    }
};

} // namespace textvault
