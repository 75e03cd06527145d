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
#include <cstddef>
#include <string>
#include <utility>

namespace textvault {
    namespace persist {

        // err is an errno value.
        struct FSResult {
            bool ok;
            int err;
        };

        enum class PathKind {
            Missing,
            File,
            Directory,
            Other
        };

        class PlatformFS {
        public:
            static FSResult flush_file(intptr_t file_handle);
            static FSResult fsync_directory(const std::string& dir_path);

            /**
             * Replace `final` with `tmp` in one step. Readers of `final` see
             * either the old or the new content, never a mix.
             */
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            static std::pair<FSResult, uint64_t> file_size(const std::string& path);
            static std::pair<FSResult, PathKind> path_kind(const std::string& path);

            // Bytes available to an unprivileged writer on the volume holding `path`.
            static std::pair<FSResult, uint64_t> available_space(const std::string& path);

            // Overwrites `dst`; the copy is flushed before returning.
            static FSResult copy_file(const std::string& src, const std::string& dst);

            // A missing file is not an error.
            static FSResult remove_file(const std::string& path);
        };

    }
} // namespace textvault::persist
