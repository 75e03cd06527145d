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
#include <cstddef>

namespace textvault {

// Sequential and random-access reads
namespace streaming {
    constexpr size_t kDefaultChunkSize = 8 * 1024;                // 8KB chunks
    constexpr uint64_t kMaxSegmentRequest = 200ULL * 1024 * 1024;  // warn above 200MB per segment
    constexpr size_t kMaxCarriedWordBytes = 2048;                 // longer runs are split at the chunk edge
    constexpr size_t kTrailerTailBytes = 4 * 1024;                // tail read that decides if a trailer exists
    constexpr uint64_t kMaxTrailerBytes = 64ULL * 1024 * 1024;    // stop looking for the start marker here
}

// Segment cache
namespace cache {
    constexpr size_t kDefaultCapacity = 10;                       // segments, not bytes
}

// File analysis thresholds
namespace analyzer {
    constexpr size_t kSampleSize = 8 * 1024;                              // head sample for line estimate
    constexpr uint64_t kLargeCategoryThreshold = 10ULL * 1024 * 1024;     // 10MB: worth a notice
    constexpr uint64_t kStreamingThreshold = 50ULL * 1024 * 1024;         // 50MB: stream instead of load
    constexpr uint64_t kSafetyThreshold = 500ULL * 1024 * 1024;           // 500MB: risky to load at all
    constexpr double kMemoryExpansionFactor = 2.5;                        // decoded text vs bytes on disk
    constexpr double kLoadBytesPerSecond = 50.0 * 1024 * 1024;            // conservative read+decode rate
    constexpr uint32_t kMinLoadTimeMs = 100;
}

// Retry and fallback policy
namespace recovery {
    constexpr uint32_t kMaxRetryAttempts = 3;
    constexpr uint32_t kBaseRetryDelayMs = 1000;
    constexpr uint32_t kMaxRetryDelayMs = 10000;
    constexpr double kJitterFraction = 0.1;                               // up to 10% of the base delay
    constexpr size_t kFallbackChunkSize = 4 * 1024;
    constexpr size_t kFallbackContentCap = 100ULL * 1024 * 1024;          // 100MB accumulator cap
    constexpr size_t kHeadOnlyBytes = 10ULL * 1024 * 1024;                // 10MB head-only read
}

// Atomic writer
namespace writer {
    constexpr size_t kFlushEveryLines = 1000;
    constexpr size_t kProgressEveryLines = 10000;
    constexpr uint64_t kSpaceFactorRequired = 2;                          // need 2x content size free
    constexpr uint64_t kSpaceFactorComfortable = 4;                       // warn below 4x
    constexpr size_t kStreamBufferSize = 64 * 1024;
}

// File naming
namespace files {
    constexpr const char* kBackupSuffix = ".backup";
    constexpr const char* kTempSuffix = ".tmp";
#ifdef _WIN32
    constexpr const char* kLineEnding = "\r\n";
#else
    constexpr const char* kLineEnding = "\n";
#endif
}

} // namespace textvault
