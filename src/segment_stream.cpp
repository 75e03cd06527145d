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

#include "segment_stream.h"
#include "chunk_reader.h"
#include "config.h"
#include "util/log.h"
#include "util/text_codec.h"

#include <new>
#include <stdexcept>

namespace textvault {

namespace {

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }

    // Where to cut so that a trailing word stays whole, or `cut` itself
    // when the word is too long to hold back.
    size_t before_trailing_word(const std::string& s, size_t cut) {
        size_t b = cut;
        while (b > 0 && !is_space(s[b - 1])) {
            if (cut - b >= streaming::kMaxCarriedWordBytes) {
                return cut;
            }
            --b;
        }
        return b;
    }

} // namespace

SegmentStream::SegmentStream(std::string path,
                             size_t chunk_size,
                             std::shared_ptr<const HyperlinkExtractor> extractor,
                             ProgressCallback on_progress,
                             CancellationToken cancel,
                             EventSink* sink)
    : path_(std::move(path)),
      chunk_size_(chunk_size),
      extractor_(std::move(extractor)),
      on_progress_(std::move(on_progress)),
      cancel_(std::move(cancel)),
      sink_(sink) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("SegmentStream: chunk size must be positive");
    }
}

void SegmentStream::finish(Result<void> status) {
    done_ = true;
    status_ = std::move(status);
    buffer_.clear();
    buffer_.shrink_to_fit();
    carry_.clear();

    if (file_.is_open()) {
        try {
            file_.close();
        } catch (const std::system_error& e) {
            warning() << "SegmentStream: " << e.what();
        }
    }

    if (!status_.ok()) {
        if (status_.kind() == ErrorKind::Cancelled) {
            info() << "Streaming " << path_ << " cancelled after " << offset_ << " bytes";
        } else {
            report(sink_, ErrorCategory::FileIO, Severity::Error,
                   "Error streaming file: " + status_.error().message, path_);
        }
    } else {
        debug() << "Streaming " << path_ << " complete, " << offset_ << " bytes";
    }
}

TextSegment SegmentStream::make_segment(const char* data, size_t len, uint64_t start) {
    TextSegment seg = ChunkReader::build_segment(data, len, start, extractor_.get());
    if (next_trailer_link_ < trailer_links_.size()) {
        uint64_t end = start + len;
        bool last = end >= content_end_;
        std::vector<Hyperlink> stored;
        while (next_trailer_link_ < trailer_links_.size() &&
               (last || static_cast<uint64_t>(trailer_links_[next_trailer_link_].start_index) < end)) {
            stored.push_back(std::move(trailer_links_[next_trailer_link_++]));
        }
        ChunkReader::attach_links(seg, std::move(stored));
    }
    return seg;
}

void SegmentStream::emit_progress() {
    if (on_progress_) {
        on_progress_(ProgressEvent::make(offset_, total_, "Streaming file"));
    }
}

std::optional<TextSegment> SegmentStream::next() {
    if (done_) {
        return std::nullopt;
    }

    try {
        if (!opened_) {
            cancel_.throw_if_cancelled();
            file_ = persist::FileHandle::open_read(path_);
            total_ = file_.size();
            content_end_ = total_;
            if (extractor_ && extractor_->reads_trailer()) {
                std::optional<FileTrailer> trailer = ChunkReader::find_trailer(file_, total_, cancel_);
                if (trailer) {
                    content_end_ = trailer->body_end;
                    trailer_links_ = std::move(trailer->links);
                }
            }
            buffer_.resize(chunk_size_);
            opened_ = true;
            debug() << "Streaming " << path_ << " (" << total_ << " bytes, "
                    << chunk_size_ << " byte chunks)";
        }

        for (;;) {
            if (offset_ >= content_end_) {
                // whatever is still held back, plus any trailer bytes, is all that is left
                uint64_t start = offset_ - carry_.size();
                uint64_t tail = total_ - offset_;
                if (carry_.empty() && tail == 0) {
                    finish(Result<void>::success());
                    return std::nullopt;
                }
                TextSegment seg = make_segment(carry_.data(), carry_.size(), start);
                seg.length += tail;
                carry_.clear();
                offset_ = total_;
                if (tail > 0) {
                    emit_progress();
                }
                finish(Result<void>::success());
                return seg;
            }

            cancel_.throw_if_cancelled();

            size_t want = chunk_size_;
            if (content_end_ - offset_ < want) {
                want = static_cast<size_t>(content_end_ - offset_);
            }
            size_t n = file_.read_at(buffer_.data(), want, offset_, cancel_);
            if (n == 0) {
                // file shrank underneath us
                warning() << "Streaming " << path_ << ": unexpected EOF at " << offset_
                          << " of " << total_;
                total_ = offset_;
                content_end_ = offset_;
                continue;
            }

            uint64_t start = offset_ - carry_.size();
            offset_ += n;
            carry_.append(buffer_.data(), n);

            size_t cut = carry_.size();
            if (offset_ < content_end_) {
                cut = text::utf8_safe_boundary(carry_.data(), carry_.size());
                if (cut > 0 && carry_[cut - 1] == '\r') {
                    --cut;
                }
                if (extractor_) {
                    cut = before_trailing_word(carry_, cut);
                }
            }

            if (cut == 0) {
                emit_progress();
                continue;
            }

            TextSegment seg = make_segment(carry_.data(), cut, start);
            carry_.erase(0, cut);
            if (offset_ >= content_end_ && carry_.empty()) {
                // the trailer, if any, rides on the last segment
                seg.length += total_ - offset_;
                offset_ = total_;
                emit_progress();
                finish(Result<void>::success());
                return seg;
            }
            emit_progress();
            return seg;
        }
    } catch (const std::exception&) {
        finish(Result<void>::failure(classify_exception(std::current_exception())));
        return std::nullopt;
    }
}

} // namespace textvault
