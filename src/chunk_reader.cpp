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

#include "chunk_reader.h"
#include "config.h"
#include "errors.h"
#include "persistence/file_handle.h"
#include "util/log.h"
#include "util/text_codec.h"

#include <algorithm>
#include <limits>
#include <new>
#include <stdexcept>
#include <string_view>
#include <sys/types.h>

namespace textvault {

namespace {

    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
    }

    // Exactly `len` bytes at `offset`, or nothing if the file ends first.
    std::optional<std::string> read_exact(const persist::FileHandle& fh, uint64_t offset, size_t len,
                                          const CancellationToken& cancel) {
        std::string buf(len, '\0');
        size_t n = len == 0 ? 0 : fh.read_at(&buf[0], len, offset, cancel);
        if (n != len) {
            return std::nullopt;
        }
        return buf;
    }

    bool overlaps(const Hyperlink& a, const Hyperlink& b) {
        return a.start_index < b.end_index() && b.start_index < a.end_index();
    }

} // namespace

std::vector<Hyperlink> FileTrailer::links_in(uint64_t from, uint64_t to) const {
    std::vector<Hyperlink> out;
    for (const auto& link : links) {
        uint64_t s = static_cast<uint64_t>(link.start_index);
        if (s >= from && s < to) {
            out.push_back(link);
        }
    }
    return out;
}

ChunkReader::ChunkReader(std::string path, std::shared_ptr<const HyperlinkExtractor> extractor)
    : path_(std::move(path)), extractor_(std::move(extractor)) {
    if (path_.empty()) {
        throw std::invalid_argument("ChunkReader: file path cannot be empty");
    }
}

TextSegment ChunkReader::read(uint64_t start_position, uint64_t length,
                              const CancellationToken& cancel) const {
    if (length == 0) {
        throw std::invalid_argument("Length must be positive");
    }
    if (start_position > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        throw std::invalid_argument("Start position " + std::to_string(start_position) +
                                    " is not a valid file offset");
    }

    cancel.throw_if_cancelled();

    persist::FileHandle fh = persist::FileHandle::open_read(path_);
    uint64_t file_size = fh.size();

    if (start_position >= file_size) {
        throw std::out_of_range("Start position " + std::to_string(start_position) +
                                " is beyond file length " + std::to_string(file_size));
    }

    uint64_t content_end = file_size;
    std::optional<FileTrailer> trailer;
    if (extractor_ && extractor_->reads_trailer()) {
        trailer = find_trailer(fh, file_size, cancel);
        if (trailer) {
            content_end = trailer->body_end;
        }
    }

    uint64_t available = file_size - start_position;
    uint64_t to_read = std::min(length, available);
    if (to_read > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        throw std::bad_alloc();
    }

    std::string raw;
    raw.resize(static_cast<size_t>(to_read));
    size_t n = fh.read_at(&raw[0], raw.size(), start_position, cancel);
    raw.resize(n);
    reads_.fetch_add(1, std::memory_order_relaxed);

    trace() << "ChunkReader: read " << n << " bytes at " << start_position << " from " << path_;

    size_t body = 0;
    if (start_position < content_end) {
        body = static_cast<size_t>(std::min<uint64_t>(raw.size(), content_end - start_position));
    }
    TextSegment seg = build_segment(raw.data(), body, start_position, extractor_.get());
    seg.length = raw.size();
    if (trailer) {
        attach_links(seg, trailer->links_in(start_position, start_position + body));
    }
    return seg;
}

std::optional<FileTrailer> ChunkReader::find_trailer(const persist::FileHandle& fh, uint64_t file_size,
                                                     const CancellationToken& cancel) {
    const std::string_view start_marker(MetadataTrailerExtractor::kStartMarker);
    const std::string_view end_marker(MetadataTrailerExtractor::kEndMarker);
    if (file_size < start_marker.size() + end_marker.size()) {
        return std::nullopt;
    }

    size_t tail_len = static_cast<size_t>(std::min<uint64_t>(file_size, streaming::kTrailerTailBytes));
    std::optional<std::string> tail = read_exact(fh, file_size - tail_len, tail_len, cancel);
    if (!tail) {
        return std::nullopt;
    }
    size_t t = tail->size();
    while (t > 0 && is_space((*tail)[t - 1])) --t;
    if (t < end_marker.size() || std::string_view(*tail).substr(t - end_marker.size(), end_marker.size()) != end_marker) {
        return std::nullopt;
    }
    uint64_t json_end = file_size - tail_len + (t - end_marker.size());

    // Read backwards in growing blocks; `region` holds [lo, json_end)
    uint64_t floor = json_end > streaming::kMaxTrailerBytes ? json_end - streaming::kMaxTrailerBytes : 0;
    uint64_t lo = json_end;
    std::string region;
    size_t found = std::string::npos;
    while (lo > floor && found == std::string::npos) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(std::max(streaming::kTrailerTailBytes, region.size()),
                                                             lo - floor));
        std::optional<std::string> block = read_exact(fh, lo - want, want, cancel);
        if (!block) {
            return std::nullopt;
        }
        lo -= want;
        region.insert(0, *block);
        // only start positions inside the new block are unsearched
        found = region.rfind(start_marker, want - 1);
    }
    if (found == std::string::npos) {
        return std::nullopt;
    }

    std::vector<Hyperlink> links;
    std::string_view json = std::string_view(region).substr(found + start_marker.size());
    if (!MetadataTrailerExtractor::from_json(json, &links)) {
        debug() << "Trailer at " << (lo + found) << " in " << fh.path() << " is not valid; reading it as text";
        return std::nullopt;
    }

    // The content ends at the last non-space byte before the marker
    uint64_t body_end = lo + found;
    size_t k = found;
    while (k > 0 && is_space(region[k - 1])) {
        --k;
        --body_end;
    }
    while (k == 0 && body_end > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(body_end, streaming::kTrailerTailBytes));
        std::optional<std::string> before = read_exact(fh, body_end - want, want, cancel);
        if (!before) {
            return std::nullopt;
        }
        k = want;
        while (k > 0 && is_space((*before)[k - 1])) {
            --k;
            --body_end;
        }
    }

    FileTrailer out;
    out.body_end = body_end;
    for (auto& link : links) {
        if (link.start_index >= 0 && link.length >= 0 &&
            static_cast<uint64_t>(link.end_index()) <= body_end) {
            out.links.push_back(std::move(link));
        }
    }
    std::stable_sort(out.links.begin(), out.links.end(),
                     [](const Hyperlink& a, const Hyperlink& b) { return a.start_index < b.start_index; });

    debug() << "Hyperlink trailer in " << fh.path() << ": " << out.links.size()
            << " link(s), content ends at " << body_end;
    return out;
}

void ChunkReader::attach_links(TextSegment& seg, std::vector<Hyperlink> stored) {
    if (stored.empty()) {
        return;
    }
    seg.hyperlinks.erase(std::remove_if(seg.hyperlinks.begin(), seg.hyperlinks.end(),
                                        [&stored](const Hyperlink& h) {
                                            return std::any_of(stored.begin(), stored.end(),
                                                               [&h](const Hyperlink& s) { return overlaps(h, s); });
                                        }),
                         seg.hyperlinks.end());
    for (auto& link : stored) {
        seg.hyperlinks.push_back(std::move(link));
    }
    std::stable_sort(seg.hyperlinks.begin(), seg.hyperlinks.end(),
                     [](const Hyperlink& a, const Hyperlink& b) { return a.start_index < b.start_index; });
}

TextSegment ChunkReader::build_segment(const char* data, size_t len,
                                       uint64_t start_position,
                                       const HyperlinkExtractor* extractor) {
    TextSegment seg;
    seg.start_position = start_position;
    seg.length = len;

    size_t skip = 0;
    if (start_position == 0 && text::detect_encoding(data, len) == text::Encoding::Utf8Bom) {
        skip = text::kUtf8BomSize;
    }

    try {
        size_t replaced = 0;
        std::string decoded = text::decode_utf8(data + skip, len - skip, &replaced);
        if (replaced > 0) {
            debug() << "Segment at " << start_position << ": replaced " << replaced
                    << " invalid UTF-8 sequence(s)";
        }
        seg.content = text::normalize_line_endings(decoded);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        warning() << "Segment at " << start_position << ": decode failed, using raw bytes: " << e.what();
        seg.content.assign(data + skip, len - skip);
        return seg;
    }

    if (!extractor) {
        return seg;
    }

    try {
        Extraction ex = extractor->extract(seg.content);
        seg.hyperlinks = std::move(ex.hyperlinks);
        for (auto& link : seg.hyperlinks) {
            link.start_index += static_cast<int64_t>(start_position);
        }
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        warning() << "Segment at " << start_position << ": hyperlink extraction failed: " << e.what();
        seg.hyperlinks.clear();
    }

    return seg;
}

} // namespace textvault
