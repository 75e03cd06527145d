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
#include <functional>
#include <string>
#include <vector>

#include "hyperlink.h"

namespace textvault {

/**
 * Decoded, position-tagged slice of a file. `length` counts source bytes
 * (a BOM at offset 0 is covered but not emitted), so it generally differs
 * from content.size().
 */
struct TextSegment {
    uint64_t start_position = 0;
    uint64_t length = 0;
    std::string content;
    std::vector<Hyperlink> hyperlinks;     // start_index is file-global
    std::chrono::steady_clock::time_point last_accessed = std::chrono::steady_clock::now();

    uint64_t end_position() const { return start_position + length; }
};

struct ProgressEvent {
    uint64_t processed_bytes = 0;
    uint64_t total_bytes = 0;
    double percent_complete = 0.0;
    std::string operation;

    static ProgressEvent make(uint64_t processed, uint64_t total, std::string op) {
        ProgressEvent ev;
        ev.processed_bytes = processed;
        ev.total_bytes = total;
        if (total > 0) {
            double pct = static_cast<double>(processed) * 100.0 / static_cast<double>(total);
            ev.percent_complete = pct > 100.0 ? 100.0 : pct;
        }
        ev.operation = std::move(op);
        return ev;
    }
};

typedef std::function<void(const ProgressEvent&)> ProgressCallback;

} // namespace textvault
