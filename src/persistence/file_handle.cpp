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

#include "file_handle.h"
#include "platform_fs.h"
#include "../cancellation.h"
#include "../errors.h"
#include "../util/log.h"

#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

namespace textvault {
namespace persist {

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            warning() << "close failed for " << path_ << ": " << errnoWithDescription();
        }
        fd_ = -1;
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

FileHandle FileHandle::open_read(const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw_errno(errno, "open " + path);
    }

    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw_errno(EISDIR, "open " + path);
    }
    return FileHandle(fd, path);
}

FileHandle FileHandle::open_write(const std::string& path) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw_errno(errno, "create " + path);
    }
    return FileHandle(fd, path);
}

uint64_t FileHandle::size() const {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        throw_errno(errno, "stat " + path_);
    }
    return static_cast<uint64_t>(st.st_size);
}

size_t FileHandle::read_at(char* buf, size_t len, uint64_t offset, const CancellationToken& cancel) const {
    size_t total = 0;
    while (total < len) {
        cancel.throw_if_cancelled();

        size_t want = len - total;
        if (want > static_cast<size_t>(SSIZE_MAX)) {
            want = static_cast<size_t>(SSIZE_MAX);
        }
        ssize_t n = ::pread(fd_, buf + total, want, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno(errno, "read " + path_);
        }
        if (n == 0) break;   // EOF
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t FileHandle::read_some(char* buf, size_t len) const {
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno != EINTR) {
            throw_errno(errno, "read " + path_);
        }
    }
}

void FileHandle::write_all(const char* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t n = ::write(fd_, data + off, len - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno(errno, "write " + path_);
        }
        off += static_cast<size_t>(n);
    }
}

void FileHandle::sync() {
    FSResult r = PlatformFS::flush_file(fd_);
    if (!r.ok) {
        throw_errno(r.err, "sync " + path_);
    }
}

void FileHandle::close() {
    if (fd_ < 0) return;
    int rc = ::close(fd_);
    int e = errno;
    fd_ = -1;
    if (rc != 0 && e != EINTR) {
        throw_errno(e, "close " + path_);
    }
}

} // namespace persist
} // namespace textvault
