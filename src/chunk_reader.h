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

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.h"
#include "hyperlink.h"
#include "text_segment.h"

namespace textvault {

namespace persist {
class FileHandle;
}

/**
 * A hyperlink trailer found at the end of a file. Content ends at
 * `body_end`; `links` carry file-global indices, sorted by start.
 */
struct FileTrailer {
    uint64_t body_end = 0;
    std::vector<Hyperlink> links;

    // Links whose start index falls in [from, to).
    std::vector<Hyperlink> links_in(uint64_t from, uint64_t to) const;
};

/**
 * Reads a byte range of one file and turns it into a TextSegment.
 *
 * read() throws on failure:
 *   std::invalid_argument   zero length or an offset beyond off_t
 *   std::out_of_range       start at or past EOF
 *   std::system_error       open/read failure, errno preserved
 *   std::bad_alloc          buffer allocation
 *   OperationCancelled      token fired between reads
 */
class ChunkReader {
public:
    explicit ChunkReader(std::string path,
                         std::shared_ptr<const HyperlinkExtractor> extractor = nullptr);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    TextSegment read(uint64_t start_position, uint64_t length,
                     const CancellationToken& cancel = CancellationToken()) const;

    /**
     * Decode `len` raw bytes that begin at `start_position` in the file.
     * The BOM is only honored at offset 0. Decode or extraction failures
     * are logged and yield the raw bytes with no hyperlinks; std::bad_alloc
     * propagates.
     */
    static TextSegment build_segment(const char* data, size_t len,
                                     uint64_t start_position,
                                     const HyperlinkExtractor* extractor);

    /**
     * Look for a trailer at the end of an open file. The file must end
     * with the end marker (trailing whitespace allowed); the start marker
     * is searched backwards from there. A trailer whose JSON does not parse
     * is treated as ordinary content.
     */
    static std::optional<FileTrailer> find_trailer(const persist::FileHandle& fh, uint64_t file_size,
                                                   const CancellationToken& cancel);

    // Add stored links to a segment, dropping extracted links that overlap them.
    static void attach_links(TextSegment& seg, std::vector<Hyperlink> stored);

    // Successful disk reads since construction.
    uint64_t reads() const { return reads_.load(std::memory_order_relaxed); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::shared_ptr<const HyperlinkExtractor> extractor_;
    mutable std::atomic<uint64_t> reads_{0};
};

} // namespace textvault
