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
#include <string>

#include "diagnostics.h"
#include "engine_config.h"
#include "errors.h"

namespace textvault {

enum class SizeCategory {
    Normal,
    Large,          // above large_threshold
    VeryLarge,      // above streaming_threshold
    Extreme         // above safety_threshold
};

enum class LoadRecommendation {
    Normal,
    Streaming,
    NotRecommended
};

const char* to_string(SizeCategory c);
const char* to_string(LoadRecommendation r);

struct StreamingFileInfo {
    std::string file_path;
    uint64_t file_size = 0;
    bool is_large_file = false;
    uint64_t estimated_line_count = 0;     // extrapolated from the head sample; approximate
    bool requires_streaming = false;

    bool exceeds_safety_threshold = false;
    SizeCategory category = SizeCategory::Normal;
    LoadRecommendation recommendation = LoadRecommendation::Normal;
    uint64_t estimated_memory_bytes = 0;
    std::chrono::milliseconds estimated_load_time{0};
};

/**
 * Decides how a file should be opened. Read-only: at most one sample of
 * `sample_size` bytes is read from the start of the file.
 */
class FileAnalyzer {
public:
    explicit FileAnalyzer(EngineConfig config = EngineConfig::defaults(), EventSink* sink = nullptr);

    Result<StreamingFileInfo> analyze(const std::string& path) const;

    // False (with a log line) instead of an error for bad paths.
    bool is_large_file(const std::string& path) const;

    /**
     * round((newlines + 1) / sample_bytes * file_size); 0 for an empty sample.
     */
    static uint64_t estimate_line_count(uint64_t newlines_in_sample, uint64_t sample_bytes, uint64_t file_size);

    static std::string format_bytes(uint64_t bytes);

private:
    void fill_size_estimates(StreamingFileInfo& info) const;

    EngineConfig config_;
    EventSink* sink_;
};

} // namespace textvault
