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
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation.h"
#include "chunk_reader.h"
#include "diagnostics.h"
#include "engine_config.h"
#include "errors.h"
#include "hyperlink.h"
#include "lru.h"
#include "recovery/error_recovery.h"
#include "recovery/memory_coordinator.h"
#include "segment_stream.h"
#include "text_segment.h"

namespace textvault {

/**
 * StreamingEngine: sequential streaming and cached random access over one
 * text file.
 *
 * Sequential:
 *   auto s = engine.stream(path, [](const ProgressEvent& p) { ... }, token);
 *   while (auto seg = s.next()) { ... }
 *
 * Random access:
 *   engine.open(path);
 *   Result<TextSegment> seg = engine.load_segment(offset, length, token);
 *
 * Segments are cached by chunk-aligned offset in an entry-bounded LRU. The
 * cache registers with the MemoryCoordinator and is dropped on aggressive
 * collection.
 *
 * Thread-safety:
 *   load_segment and the cache accessors may be called concurrently; a
 *   single mutex covers the cache. stream() returns an independent object
 *   owned by the caller.
 */
class StreamingEngine {
public:
    typedef std::function<void(const TextSegment&)> SegmentListener;

    explicit StreamingEngine(EngineConfig config = EngineConfig::defaults(),
                             std::shared_ptr<const HyperlinkExtractor> extractor = nullptr,
                             std::shared_ptr<MemoryCoordinator> memory = nullptr,
                             EventSink* sink = nullptr);
    ~StreamingEngine();

    StreamingEngine(const StreamingEngine&) = delete;
    StreamingEngine& operator=(const StreamingEngine&) = delete;

    // ========== Sequential ==========

    SegmentStream stream(const std::string& path,
                         ProgressCallback on_progress = nullptr,
                         CancellationToken cancel = CancellationToken()) const;

    /**
     * Segments of `path` whose content contains `term`.
     */
    Result<std::vector<TextSegment>> search(const std::string& path,
                                            const std::string& term,
                                            bool case_sensitive = false,
                                            const CancellationToken& cancel = CancellationToken()) const;

    // ========== Random access ==========

    /**
     * Bind to `path` for load_segment. Switching files clears the cache.
     */
    Result<void> open(const std::string& path);

    std::string current_path() const;

    Result<TextSegment> load_segment(uint64_t start_position, uint64_t length,
                                     const CancellationToken& cancel = CancellationToken());

    std::future<Result<TextSegment>> load_segment_async(uint64_t start_position, uint64_t length,
                                                        CancellationToken cancel = CancellationToken());

    // Called after every segment read from disk (not on cache hits).
    void on_segment_loaded(SegmentListener listener);

    // ========== Cache ==========

    size_t cache_size() const;

    // Cached keys from least to most recently used.
    std::vector<uint64_t> cached_offsets() const;

    void clear_cache();

    // Disk reads issued by load_segment for the current file.
    uint64_t disk_reads() const;

    const EngineConfig& config() const { return config_; }
    ErrorRecovery& recovery() { return recovery_; }

private:
    struct CacheEntry {
        TextSegment segment;
        uint64_t requested_length;
    };

    uint64_t cache_key(uint64_t start_position) const {
        return start_position - (start_position % config_.chunk_size);
    }

    size_t drop_cache();

    EngineConfig config_;
    std::shared_ptr<const HyperlinkExtractor> extractor_;
    std::shared_ptr<MemoryCoordinator> memory_;
    EventSink* sink_;
    ErrorRecovery recovery_;

    mutable std::mutex mu_;
    LRUCache<uint64_t, CacheEntry> cache_;
    std::string path_;
    std::shared_ptr<ChunkReader> reader_;
    SegmentListener listener_;

    MemoryCoordinator::ReclaimerId reclaimer_id_ = 0;
};

} // namespace textvault
