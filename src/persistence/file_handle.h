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
#include <utility>

namespace textvault {

class CancellationToken;

namespace persist {

/**
 * Owning file descriptor. Move-only; closes on destruction.
 * Failures throw std::system_error carrying errno and the path.
 */
class FileHandle {
public:
    FileHandle() = default;
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    // Read-only, shared with other readers and writers.
    static FileHandle open_read(const std::string& path);

    // Create or truncate for writing.
    static FileHandle open_write(const std::string& path);

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }

    uint64_t size() const;

    /**
     * Read up to `len` bytes at `offset`, retrying short reads and EINTR.
     * Checks `cancel` between reads.
     * @return bytes read; less than `len` only at EOF
     */
    size_t read_at(char* buf, size_t len, uint64_t offset, const CancellationToken& cancel) const;

    // Sequential read from the current position; 0 at EOF.
    size_t read_some(char* buf, size_t len) const;

    void write_all(const char* data, size_t len);

    // fdatasync; throws on failure.
    void sync();

    // Close now, reporting errors that the destructor would have to drop.
    void close();

private:
    FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::string path_;
};

} // namespace persist
} // namespace textvault
