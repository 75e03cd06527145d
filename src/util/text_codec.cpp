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

#include "text_codec.h"

#include <algorithm>

namespace textvault {
namespace text {

    static const unsigned char kBom[kUtf8BomSize] = { 0xEF, 0xBB, 0xBF };
    static const char kReplacement[] = "\xEF\xBF\xBD";

    Encoding detect_encoding(const char* data, size_t len) {
        if (len >= kUtf8BomSize &&
            static_cast<unsigned char>(data[0]) == kBom[0] &&
            static_cast<unsigned char>(data[1]) == kBom[1] &&
            static_cast<unsigned char>(data[2]) == kBom[2]) {
            return Encoding::Utf8Bom;
        }
        return Encoding::Utf8;
    }

    // Expected sequence length for a lead byte, 0 if it cannot start one.
    static inline size_t sequence_length(unsigned char b) {
        if (b < 0x80) return 1;
        if (b >= 0xC2 && b <= 0xDF) return 2;
        if (b >= 0xE0 && b <= 0xEF) return 3;
        if (b >= 0xF0 && b <= 0xF4) return 4;
        return 0;
    }

    static inline bool is_continuation(unsigned char b) {
        return (b & 0xC0) == 0x80;
    }

    // Validate the sequence at p (length n, already bounds-checked).
    static bool valid_sequence(const unsigned char* p, size_t n) {
        for (size_t i = 1; i < n; ++i) {
            if (!is_continuation(p[i])) return false;
        }
        if (n == 3) {
            if (p[0] == 0xE0 && p[1] < 0xA0) return false;   // overlong
            if (p[0] == 0xED && p[1] > 0x9F) return false;   // surrogates
        } else if (n == 4) {
            if (p[0] == 0xF0 && p[1] < 0x90) return false;   // overlong
            if (p[0] == 0xF4 && p[1] > 0x8F) return false;   // > U+10FFFF
        }
        return true;
    }

    std::string decode_utf8(const char* data, size_t len, size_t* replacements) {
        std::string out;
        out.reserve(len);
        size_t bad = 0;

        const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
        size_t i = 0;
        while (i < len) {
            // fast path for ASCII runs
            size_t run = i;
            while (run < len && p[run] < 0x80) ++run;
            if (run > i) {
                out.append(data + i, run - i);
                i = run;
                continue;
            }

            size_t n = sequence_length(p[i]);
            if (n == 0 || i + n > len || !valid_sequence(p + i, n)) {
                out.append(kReplacement, 3);
                ++bad;
                // skip the lead byte and any continuation bytes that follow it
                ++i;
                while (i < len && is_continuation(p[i]) && n > 1) {
                    ++i;
                    --n;
                }
                continue;
            }
            out.append(data + i, n);
            i += n;
        }

        if (replacements) *replacements = bad;
        return out;
    }

    std::string normalize_line_endings(std::string_view in, std::string_view eol) {
        std::string result;
        result.reserve(in.size() + in.size() / 20);

        size_t start = 0;
        for (size_t i = 0; i < in.size(); i++) {
            if (in[i] == '\r') {
                result.append(in.data() + start, i - start);
                result.append(eol.data(), eol.size());
                // Skip LF if it follows CR (CRLF sequence)
                if (i + 1 < in.size() && in[i + 1] == '\n') {
                    i++;
                }
                start = i + 1;
            } else if (in[i] == '\n') {
                result.append(in.data() + start, i - start);
                result.append(eol.data(), eol.size());
                start = i + 1;
            }
        }
        result.append(in.data() + start, in.size() - start);
        return result;
    }

    size_t utf8_safe_boundary(const char* data, size_t len) {
        const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
        size_t look = std::min<size_t>(len, 3);
        for (size_t back = 1; back <= look; ++back) {
            unsigned char b = p[len - back];
            if (is_continuation(b)) continue;
            size_t n = sequence_length(b);
            if (n > back) {
                // lead byte whose sequence runs past the end
                return len - back;
            }
            return len;
        }
        return len;
    }

    size_t count_newlines(const char* data, size_t len) {
        return static_cast<size_t>(std::count(data, data + len, '\n'));
    }

} // namespace text
} // namespace textvault
