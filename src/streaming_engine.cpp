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

#include "streaming_engine.h"
#include "persistence/platform_fs.h"
#include "util/log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <new>
#include <stdexcept>

namespace textvault {

StreamingEngine::StreamingEngine(EngineConfig config,
                                 std::shared_ptr<const HyperlinkExtractor> extractor,
                                 std::shared_ptr<MemoryCoordinator> memory,
                                 EventSink* sink)
    : config_(std::move(config)),
      extractor_(extractor ? std::move(extractor) : std::make_shared<CompositeExtractor>()),
      memory_(memory ? std::move(memory) : std::make_shared<MemoryCoordinator>()),
      sink_(sink),
      recovery_(config_.recovery, memory_, sink),
      cache_(config_.cache_capacity) {
    if (!config_.validate()) {
        throw std::invalid_argument("StreamingEngine: invalid configuration");
    }

    // only an aggressive collection is worth throwing the cache away for
    reclaimer_id_ = memory_->register_reclaimer("segment-cache",
                                                [this](bool) { return drop_cache(); },
                                                false);
}

StreamingEngine::~StreamingEngine() {
    memory_->unregister_reclaimer(reclaimer_id_);
}

// ---------------------------------------------------------------------------
// Sequential
// ---------------------------------------------------------------------------

SegmentStream StreamingEngine::stream(const std::string& path,
                                      ProgressCallback on_progress,
                                      CancellationToken cancel) const {
    return SegmentStream(path, config_.chunk_size, extractor_,
                         std::move(on_progress), std::move(cancel), sink_);
}

namespace {

    bool contains_term(const std::string& haystack, const std::string& needle, bool case_sensitive) {
        if (case_sensitive) {
            return haystack.find(needle) != std::string::npos;
        }
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](char a, char b) {
                                  return std::tolower(static_cast<unsigned char>(a)) ==
                                         std::tolower(static_cast<unsigned char>(b));
                              });
        return it != haystack.end();
    }

} // namespace

Result<std::vector<TextSegment>> StreamingEngine::search(const std::string& path,
                                                         const std::string& term,
                                                         bool case_sensitive,
                                                         const CancellationToken& cancel) const {
    if (term.empty()) {
        return Result<std::vector<TextSegment>>::failure(ErrorKind::InvalidInput,
                                                         "Search term cannot be empty");
    }

    std::vector<TextSegment> matches;
    SegmentStream s = stream(path, nullptr, cancel);
    while (auto seg = s.next()) {
        if (contains_term(seg->content, term, case_sensitive)) {
            matches.push_back(std::move(*seg));
        }
    }

    if (!s.status()) {
        return Result<std::vector<TextSegment>>::failure(s.status().error());
    }
    debug() << "search '" << term << "' in " << path << ": " << matches.size() << " segment(s)";
    return Result<std::vector<TextSegment>>::success(std::move(matches));
}

// ---------------------------------------------------------------------------
// Random access
// ---------------------------------------------------------------------------

Result<void> StreamingEngine::open(const std::string& path) {
    if (path.empty()) {
        return Result<void>::failure(ErrorKind::InvalidInput, "File path cannot be empty");
    }

    auto kind = persist::PlatformFS::path_kind(path);
    if (!kind.first.ok) {
        return Result<void>::failure(kind_from_errno(kind.first.err),
                                     "Cannot access " + path + ": " + errnoWithDescription(kind.first.err),
                                     kind.first.err);
    }
    if (kind.second == persist::PathKind::Missing) {
        return Result<void>::failure(ErrorKind::NotFound, "File not found: " + path, ENOENT);
    }
    if (kind.second == persist::PathKind::Directory) {
        return Result<void>::failure(ErrorKind::InvalidInput, path + " is a directory", EISDIR);
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (path != path_) {
        cache_.clear();
        path_ = path;
        reader_ = std::make_shared<ChunkReader>(path, extractor_);
        info() << "StreamingEngine: opened " << path;
    }
    return Result<void>::success();
}

std::string StreamingEngine::current_path() const {
    std::lock_guard<std::mutex> lock(mu_);
    return path_;
}

Result<TextSegment> StreamingEngine::load_segment(uint64_t start_position, uint64_t length,
                                                  const CancellationToken& cancel) {
    if (length == 0) {
        return Result<TextSegment>::failure(ErrorKind::InvalidInput, "Length must be positive");
    }
    if (length > config_.max_segment_request) {
        warning() << "load_segment: request of " << length << " bytes exceeds the "
                  << config_.max_segment_request << " byte memory ceiling";
    }

    const uint64_t key = cache_key(start_position);
    std::shared_ptr<ChunkReader> reader;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!reader_) {
            return Result<TextSegment>::failure(ErrorKind::InvalidInput, "No file is open");
        }
        reader = reader_;

        if (CacheEntry* hit = cache_.get(key)) {
            if (hit->segment.start_position == start_position && hit->requested_length == length) {
                hit->segment.last_accessed = std::chrono::steady_clock::now();
                trace() << "load_segment: cache hit at " << key;
                return Result<TextSegment>::success(hit->segment);
            }
        }
    }

    if (cancel.is_cancelled()) {
        return Result<TextSegment>::failure(ErrorKind::Cancelled, "Operation was cancelled");
    }

    const uint64_t reduced = std::min<uint64_t>(length, config_.chunk_size);
    RecoveryResult<TextSegment> r = recovery_.recover_memory_operation<TextSegment>(
        [&](const CancellationToken& tok) { return reader->read(start_position, length, tok); },
        [&](const CancellationToken& tok) { return reader->read(start_position, reduced, tok); },
        "load segment at " + std::to_string(start_position),
        cancel);

    if (!r.success) {
        return Result<TextSegment>::failure(r.error_kind, r.error_message.value_or("Failed to load segment"));
    }

    TextSegment segment = std::move(*r.result);
    segment.last_accessed = std::chrono::steady_clock::now();

    bool cache_dropped = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        // the file may have been switched while we were reading
        if (reader == reader_) {
            try {
                cache_.add(key, CacheEntry{segment, length});
            } catch (const std::bad_alloc&) {
                cache_.clear();
                cache_dropped = true;
            }
        }
    }
    if (cache_dropped) {
        report(sink_, ErrorCategory::Memory, Severity::Warning,
               "Out of memory caching segment; cache cleared", current_path());
        memory_->collect(true);
    }

    SegmentListener listener;
    {
        std::lock_guard<std::mutex> lock(mu_);
        listener = listener_;
    }
    if (listener) {
        listener(segment);
    }

    return Result<TextSegment>::success(std::move(segment));
}

std::future<Result<TextSegment>> StreamingEngine::load_segment_async(uint64_t start_position, uint64_t length,
                                                                     CancellationToken cancel) {
    return std::async(std::launch::async, [this, start_position, length, cancel]() {
        return load_segment(start_position, length, cancel);
    });
}

void StreamingEngine::on_segment_loaded(SegmentListener listener) {
    std::lock_guard<std::mutex> lock(mu_);
    listener_ = std::move(listener);
}

// ---------------------------------------------------------------------------
// Cache
// ---------------------------------------------------------------------------

size_t StreamingEngine::cache_size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cache_.size();
}

std::vector<uint64_t> StreamingEngine::cached_offsets() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cache_.ids();
}

void StreamingEngine::clear_cache() {
    drop_cache();
}

size_t StreamingEngine::drop_cache() {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = cache_.size();
    cache_.clear();
    if (n > 0) {
        debug() << "StreamingEngine: dropped " << n << " cached segment(s)";
    }
    return n;
}

uint64_t StreamingEngine::disk_reads() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reader_ ? reader_->reads() : 0;
}

} // namespace textvault
