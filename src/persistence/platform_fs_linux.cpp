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

#include "platform_fs.h"

#ifdef TEXTVAULT_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <cerrno>
#include <filesystem>
#include <vector>

namespace textvault {
    namespace persist {

        FSResult PlatformFS::flush_file(intptr_t file_handle) {
            int rc = ::fdatasync((int)file_handle);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            // Fsync the directory to ensure the rename is persisted
            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        std::pair<FSResult, uint64_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (uint64_t)st.st_size : 0 };
        }

        std::pair<FSResult, PathKind> PlatformFS::path_kind(const std::string& path) {
            struct stat st{};
            if (::stat(path.c_str(), &st) != 0) {
                int e = errno;
                if (e == ENOENT || e == ENOTDIR) {
                    return { {true, 0}, PathKind::Missing };
                }
                return { {false, e}, PathKind::Missing };
            }
            if (S_ISREG(st.st_mode)) return { {true, 0}, PathKind::File };
            if (S_ISDIR(st.st_mode)) return { {true, 0}, PathKind::Directory };
            return { {true, 0}, PathKind::Other };
        }

        std::pair<FSResult, uint64_t> PlatformFS::available_space(const std::string& path) {
            struct statvfs vfs{};
            if (::statvfs(path.c_str(), &vfs) != 0) {
                return { {false, errno}, 0 };
            }
            return { {true, 0}, (uint64_t)vfs.f_bavail * (uint64_t)vfs.f_frsize };
        }

        FSResult PlatformFS::copy_file(const std::string& src, const std::string& dst) {
            int in = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
            if (in < 0) {
                return {false, errno};
            }

            int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (out < 0) {
                int e = errno;
                ::close(in);
                return {false, e};
            }

            std::vector<char> buf(64 * 1024);
            int err = 0;
            for (;;) {
                ssize_t n = ::read(in, buf.data(), buf.size());
                if (n < 0) {
                    if (errno == EINTR) continue;
                    err = errno;
                    break;
                }
                if (n == 0) break;

                ssize_t off = 0;
                while (off < n) {
                    ssize_t w = ::write(out, buf.data() + off, (size_t)(n - off));
                    if (w < 0) {
                        if (errno == EINTR) continue;
                        err = errno;
                        break;
                    }
                    off += w;
                }
                if (err) break;
            }

            if (!err && ::fdatasync(out) != 0) {
                err = errno;
            }
            ::close(in);
            if (::close(out) != 0 && !err) {
                err = errno;
            }
            return { err == 0, err };
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

    } // namespace persist
} // namespace textvault
#endif
