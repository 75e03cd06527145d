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

#include "file_analyzer.h"
#include "persistence/file_handle.h"
#include "persistence/platform_fs.h"
#include "util/log.h"
#include "util/text_codec.h"

#include "cancellation.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace textvault {

const char* to_string(SizeCategory c) {
    switch (c) {
        case SizeCategory::Normal:    return "Normal";
        case SizeCategory::Large:     return "Large";
        case SizeCategory::VeryLarge: return "VeryLarge";
        case SizeCategory::Extreme:   return "Extreme";
    }
    return "Unknown";
}

const char* to_string(LoadRecommendation r) {
    switch (r) {
        case LoadRecommendation::Normal:         return "Normal";
        case LoadRecommendation::Streaming:      return "Streaming";
        case LoadRecommendation::NotRecommended: return "NotRecommended";
    }
    return "Unknown";
}

FileAnalyzer::FileAnalyzer(EngineConfig config, EventSink* sink)
    : config_(std::move(config)), sink_(sink) {
    if (!config_.validate()) {
        throw std::invalid_argument("FileAnalyzer: invalid configuration");
    }
}

uint64_t FileAnalyzer::estimate_line_count(uint64_t newlines_in_sample, uint64_t sample_bytes, uint64_t file_size) {
    if (sample_bytes == 0 || file_size == 0) {
        return 0;
    }
    double lines = static_cast<double>(newlines_in_sample + 1) / static_cast<double>(sample_bytes) *
                   static_cast<double>(file_size);
    return static_cast<uint64_t>(std::llround(lines));
}

std::string FileAnalyzer::format_bytes(uint64_t bytes) {
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}

void FileAnalyzer::fill_size_estimates(StreamingFileInfo& info) const {
    const uint64_t size = info.file_size;

    if (size > config_.safety_threshold) {
        info.category = SizeCategory::Extreme;
        info.recommendation = LoadRecommendation::NotRecommended;
    } else if (size > config_.streaming_threshold) {
        info.category = SizeCategory::VeryLarge;
        info.recommendation = LoadRecommendation::Streaming;
    } else if (size > config_.large_threshold) {
        info.category = SizeCategory::Large;
        info.recommendation = LoadRecommendation::Normal;
    } else {
        info.category = SizeCategory::Normal;
        info.recommendation = LoadRecommendation::Normal;
    }

    info.estimated_memory_bytes = static_cast<uint64_t>(static_cast<double>(size) * analyzer::kMemoryExpansionFactor);

    double ms = static_cast<double>(size) / analyzer::kLoadBytesPerSecond * 1000.0;
    if (ms < analyzer::kMinLoadTimeMs) {
        ms = analyzer::kMinLoadTimeMs;
    }
    info.estimated_load_time = std::chrono::milliseconds(static_cast<int64_t>(ms));
}

Result<StreamingFileInfo> FileAnalyzer::analyze(const std::string& path) const {
    if (path.empty()) {
        report(sink_, ErrorCategory::Validation, Severity::Error, "Invalid file path for analysis");
        return Result<StreamingFileInfo>::failure(ErrorKind::InvalidInput, "File path cannot be empty");
    }

    auto kind = persist::PlatformFS::path_kind(path);
    if (!kind.first.ok) {
        return Result<StreamingFileInfo>::failure(kind_from_errno(kind.first.err),
                                                  "Cannot access " + path + ": " + errnoWithDescription(kind.first.err),
                                                  kind.first.err);
    }
    if (kind.second == persist::PathKind::Missing) {
        report(sink_, ErrorCategory::FileIO, Severity::Error, "File not found", path);
        return Result<StreamingFileInfo>::failure(ErrorKind::NotFound, "File not found: " + path, ENOENT);
    }
    if (kind.second == persist::PathKind::Directory) {
        return Result<StreamingFileInfo>::failure(ErrorKind::InvalidInput, path + " is a directory", EISDIR);
    }

    auto size = persist::PlatformFS::file_size(path);
    if (!size.first.ok) {
        return Result<StreamingFileInfo>::failure(kind_from_errno(size.first.err),
                                                  "Cannot stat " + path + ": " + errnoWithDescription(size.first.err),
                                                  size.first.err);
    }

    StreamingFileInfo fi;
    fi.file_path = path;
    fi.file_size = size.second;
    fi.is_large_file = fi.file_size > config_.streaming_threshold;
    fi.requires_streaming = fi.is_large_file;
    fi.exceeds_safety_threshold = fi.file_size > config_.safety_threshold;
    fill_size_estimates(fi);

    if (fi.file_size > 0) {
        try {
            persist::FileHandle fh = persist::FileHandle::open_read(path);
            size_t want = static_cast<size_t>(std::min<uint64_t>(fi.file_size, config_.sample_size));
            std::vector<char> sample(want);
            size_t n = fh.read_at(sample.data(), want, 0, CancellationToken());
            fi.estimated_line_count = estimate_line_count(text::count_newlines(sample.data(), n), n, fi.file_size);
        } catch (const std::exception& e) {
            warning() << "Line estimate unavailable for " << path << ": " << e.what();
            fi.estimated_line_count = 0;
        }
    }

    if (fi.exceeds_safety_threshold) {
        report(sink_, ErrorCategory::Performance, Severity::Warning,
               "File size " + format_bytes(fi.file_size) + " exceeds the safety threshold of " +
               format_bytes(config_.safety_threshold) + "; loading it in full may be unstable",
               path);
    }

    info() << "File analysis complete: " << fi.file_size / 1024 / 1024 << "MB, ~"
           << fi.estimated_line_count << " lines, streaming: " << fi.requires_streaming
           << " (" << path << ")";

    return Result<StreamingFileInfo>::success(std::move(fi));
}

bool FileAnalyzer::is_large_file(const std::string& path) const {
    if (path.empty()) {
        warning() << "is_large_file: empty path";
        return false;
    }
    auto size = persist::PlatformFS::file_size(path);
    if (!size.first.ok) {
        warning() << "is_large_file: cannot stat " << path << ": " << errnoWithDescription(size.first.err);
        return false;
    }
    return size.second > config_.streaming_threshold;
}

} // namespace textvault
