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

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "../config.h"

namespace textvault {
namespace text {

    enum class Encoding {
        Utf8,       // no byte-order mark
        Utf8Bom     // EF BB BF prefix
    };

    constexpr size_t kUtf8BomSize = 3;

    // Only the first three bytes are inspected.
    Encoding detect_encoding(const char* data, size_t len);

    /**
     * Decode UTF-8 into a validated UTF-8 string. Invalid or truncated
     * sequences become U+FFFD; `replacements` receives how many were made.
     */
    std::string decode_utf8(const char* data, size_t len, size_t* replacements = nullptr);

    /**
     * Rewrite "\r\n", "\r" and "\n" to `eol`.
     */
    std::string normalize_line_endings(std::string_view in, std::string_view eol = files::kLineEnding);

    /**
     * Largest cut <= len that does not split a UTF-8 sequence. Only the last
     * three bytes are examined, so malformed input is never held back
     * indefinitely.
     */
    size_t utf8_safe_boundary(const char* data, size_t len);

    size_t count_newlines(const char* data, size_t len);

} // namespace text
} // namespace textvault
