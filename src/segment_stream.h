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
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.h"
#include "diagnostics.h"
#include "errors.h"
#include "hyperlink.h"
#include "persistence/file_handle.h"
#include "text_segment.h"

namespace textvault {

/**
 * Lazy, single-pass sequence of segments covering a file from offset 0 to
 * EOF. The file is opened on the first next() and closed when the stream
 * ends or is destroyed.
 *
 * Segment boundaries never split a UTF-8 sequence or a CR LF pair; such
 * bytes are carried into the following segment. When an extractor is set,
 * a trailing run of non-space bytes (up to streaming::kMaxCarriedWordBytes)
 * is carried as well so that a URL is seen whole. Consequently the segment
 * lengths sum to the file size and the contents concatenate to the file
 * decoded in one piece.
 *
 * If the extractor reads trailers and the file ends with one, its links
 * are handed out with the segments they start in and the trailer bytes
 * are covered by the last segment without being emitted as content.
 *
 *   SegmentStream s = engine.stream(path, on_progress, token);
 *   for (const TextSegment& seg : s) { ... }
 *   if (!s.status()) { ... s.status().kind() ... }
 */
class SegmentStream {
public:
    SegmentStream(std::string path,
                  size_t chunk_size,
                  std::shared_ptr<const HyperlinkExtractor> extractor,
                  ProgressCallback on_progress,
                  CancellationToken cancel,
                  EventSink* sink = nullptr);

    SegmentStream(SegmentStream&&) = default;
    SegmentStream& operator=(SegmentStream&&) = default;

    /**
     * @return the next segment, or nullopt once the stream has ended
     * (EOF, cancellation or a read error; see status()).
     */
    std::optional<TextSegment> next();

    // Success while running and after a clean EOF.
    const Result<void>& status() const { return status_; }

    bool finished() const { return done_; }
    uint64_t processed_bytes() const { return offset_; }
    uint64_t total_bytes() const { return total_; }
    const std::string& path() const { return path_; }

    class iterator {
    public:
        typedef std::input_iterator_tag iterator_category;
        typedef TextSegment value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const TextSegment* pointer;
        typedef const TextSegment& reference;

        iterator() = default;
        explicit iterator(SegmentStream* s) : stream_(s) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& o) const { return at_end() == o.at_end(); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        void advance() {
            if (stream_) {
                current_ = stream_->next();
            }
        }
        bool at_end() const { return !current_.has_value(); }

        SegmentStream* stream_ = nullptr;
        std::optional<TextSegment> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    void finish(Result<void> status);
    void emit_progress();
    TextSegment make_segment(const char* data, size_t len, uint64_t start);

    std::string path_;
    size_t chunk_size_;
    std::shared_ptr<const HyperlinkExtractor> extractor_;
    ProgressCallback on_progress_;
    CancellationToken cancel_;
    EventSink* sink_;

    persist::FileHandle file_;
    bool opened_ = false;
    bool done_ = false;
    uint64_t offset_ = 0;       // bytes read from disk so far
    uint64_t total_ = 0;        // file size when opened
    uint64_t content_end_ = 0;  // total_, or where a hyperlink trailer begins
    std::vector<Hyperlink> trailer_links_;
    size_t next_trailer_link_ = 0;
    std::vector<char> buffer_;
    std::string carry_;         // bytes read but not yet emitted
    Result<void> status_ = Result<void>::success();
};

} // namespace textvault
