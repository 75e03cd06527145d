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

#include "atomic_writer.h"
#include "platform_fs.h"
#include "../util/log.h"

#include <cerrno>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>

namespace textvault {
namespace persist {

// ---------------------------------------------------------------------------
// LineWriter
// ---------------------------------------------------------------------------

LineWriter::LineWriter(FileHandle& out, const WriterConfig& config, MemoryCoordinator& memory,
                       const CancellationToken& cancel, std::string eol)
    : out_(out), config_(config), memory_(memory), cancel_(cancel), eol_(std::move(eol)) {
    buffer_.reserve(writer::kStreamBufferSize);
}

void LineWriter::append(const char* data, size_t len) {
    try {
        buffer_.append(data, len);
    } catch (const std::bad_alloc&) {
        warning() << "LineWriter: out of memory after " << lines_ << " lines, flushing and retrying";
        flush();
        buffer_.shrink_to_fit();
        memory_.collect(true);
        buffer_.append(data, len);   // a second failure propagates
    }

    if (buffer_.size() >= writer::kStreamBufferSize) {
        flush();
    }
}

void LineWriter::flush() {
    if (buffer_.empty()) {
        return;
    }
    out_.write_all(buffer_.data(), buffer_.size());
    bytes_ += buffer_.size();
    buffer_.clear();
}

void LineWriter::end_line() {
    append(eol_.data(), eol_.size());
    ++lines_;

    if (lines_ % config_.flush_every_lines == 0) {
        flush();
        cancel_.throw_if_cancelled();
    }
    if (lines_ % config_.progress_every_lines == 0) {
        info() << "Writing " << out_.path() << ": " << lines_ << " lines";
    }
}

void LineWriter::write(std::string_view piece) {
    size_t start = 0;
    for (size_t i = 0; i < piece.size(); i++) {
        char c = piece[i];
        if (c == '\r') {
            append(piece.data() + start, i - start);
            end_line();
            pending_cr_ = true;
            start = i + 1;
        } else if (c == '\n') {
            append(piece.data() + start, i - start);
            if (!pending_cr_) {
                end_line();
            }
            pending_cr_ = false;
            start = i + 1;
        } else {
            pending_cr_ = false;
        }
    }
    // an LF at the front of the next piece still pairs with a CR at the end of this one
    if (start < piece.size()) {
        append(piece.data() + start, piece.size() - start);
    }
}

void LineWriter::finish() {
    flush();
    debug() << "Wrote " << lines_ << " line breaks, " << bytes_ << " bytes to " << out_.path();
}

// ---------------------------------------------------------------------------
// AtomicWriter
// ---------------------------------------------------------------------------

AtomicWriter::AtomicWriter(EngineConfig config,
                           std::shared_ptr<const HyperlinkExtractor> codec,
                           std::shared_ptr<MemoryCoordinator> memory,
                           EventSink* sink)
    : config_(std::move(config)),
      codec_(codec ? std::move(codec) : std::make_shared<MetadataTrailerExtractor>()),
      memory_(memory ? std::move(memory) : std::make_shared<MemoryCoordinator>()),
      sink_(sink),
      recovery_(config_.recovery, memory_, sink) {
    if (!config_.validate()) {
        throw std::invalid_argument("AtomicWriter: invalid configuration");
    }
}

static std::string parent_directory(const std::string& path) {
    std::string parent = std::filesystem::path(path).parent_path().string();
    return parent.empty() ? std::string(".") : parent;
}

Result<void> AtomicWriter::validate_path(const std::string& path) const {
    if (path.empty()) {
        return Result<void>::failure(ErrorKind::InvalidInput, "File path cannot be empty");
    }

    auto target = PlatformFS::path_kind(path);
    if (!target.first.ok) {
        return Result<void>::failure(kind_from_errno(target.first.err),
                                     "Cannot access " + path + ": " + errnoWithDescription(target.first.err),
                                     target.first.err);
    }
    if (target.second == PathKind::Directory) {
        return Result<void>::failure(ErrorKind::InvalidInput, path + " is a directory", EISDIR);
    }

    std::string dir = parent_directory(path);
    auto parent = PlatformFS::path_kind(dir);
    if (!parent.first.ok) {
        return Result<void>::failure(kind_from_errno(parent.first.err),
                                     "Cannot access " + dir + ": " + errnoWithDescription(parent.first.err),
                                     parent.first.err);
    }
    if (parent.second != PathKind::Directory) {
        return Result<void>::failure(ErrorKind::NotFound, "Directory does not exist: " + dir, ENOENT);
    }
    return Result<void>::success();
}

Result<void> AtomicWriter::check_space(const std::string& path, uint64_t bytes) const {
    if (bytes == 0) {
        return Result<void>::success();
    }

    auto space = PlatformFS::available_space(parent_directory(path));
    if (!space.first.ok) {
        warning() << "Could not determine free space for " << path << ": "
                  << errnoWithDescription(space.first.err);
        return Result<void>::success();
    }

    const uint64_t available = space.second;
    const uint64_t required = bytes * config_.writer.space_factor_required;
    if (available < required) {
        report(sink_, ErrorCategory::FileIO, Severity::Error,
               "Insufficient disk space: need " + std::to_string(required) +
               " bytes, " + std::to_string(available) + " available", path);
        return Result<void>::failure(ErrorKind::InsufficientSpace,
                                     "Insufficient disk space to save " + path, ENOSPC);
    }
    if (available < bytes * config_.writer.space_factor_comfortable) {
        warning() << "Low disk space for " << path << ": " << available << " bytes available for "
                  << bytes << " bytes of content";
    }
    return Result<void>::success();
}

void AtomicWriter::replace(const std::string& tmp, const std::string& path) {
    if (fail_point_.load() == FailPoint::DuringReplace) {
        throw std::system_error(EIO, std::generic_category(), "simulated failure replacing " + path);
    }

    FSResult r = PlatformFS::atomic_replace(tmp, path);
    if (r.ok) {
        return;
    }

    warning() << "Atomic replace of " << path << " failed (" << errnoWithDescription(r.err)
              << "), falling back to delete and rename";
    FSResult rm = PlatformFS::remove_file(path);
    if (!rm.ok) {
        throw_errno(rm.err, "remove " + path);
    }
    r = PlatformFS::atomic_replace(tmp, path);
    if (!r.ok) {
        throw_errno(r.err, "rename " + tmp + " to " + path);
    }
}

void AtomicWriter::rollback(const std::string& path, bool had_original) {
    const std::string tmp = temp_path(path);
    FSResult t = PlatformFS::remove_file(tmp);
    if (!t.ok) {
        warning() << "Could not remove temp file " << tmp << ": " << errnoWithDescription(t.err);
    }

    if (!had_original) {
        return;
    }

    const std::string backup = backup_path(path);
    FSResult r = PlatformFS::atomic_replace(backup, path);
    if (r.ok) {
        info() << "Restored " << path << " from backup";
    } else {
        report(sink_, ErrorCategory::FileIO, Severity::Critical,
               "Could not restore from backup (" + errnoWithDescription(r.err) +
               "); original content remains in " + backup, path);
    }
}

Result<void> AtomicWriter::commit(const std::string& path,
                                  const TempWriter& writer,
                                  uint32_t max_attempts,
                                  const CancellationToken& cancel) {
    const std::string tmp = temp_path(path);
    const std::string backup = backup_path(path);

    if (cancel.is_cancelled()) {
        return Result<void>::failure(ErrorKind::Cancelled, "Operation was cancelled");
    }

    const bool had_original = PlatformFS::path_kind(path).second == PathKind::File;
    if (had_original) {
        FSResult b = PlatformFS::copy_file(path, backup);
        if (!b.ok) {
            FSResult rm = PlatformFS::remove_file(backup);
            if (!rm.ok) {
                warning() << "Could not remove partial backup " << backup << ": " << errnoWithDescription(rm.err);
            }
            report(sink_, ErrorCategory::FileIO, Severity::Error,
                   "Failed to create backup: " + errnoWithDescription(b.err), path);
            return Result<void>::failure(kind_from_errno(b.err),
                                         "Failed to create backup of " + path, b.err);
        }
    }

    try {
        RecoveryResult<uint64_t> written = recovery_.execute_with_retry<uint64_t>(
            [&](const CancellationToken& tok) {
                FileHandle out = FileHandle::open_write(tmp);
                uint64_t n = writer(out, tok);
                out.sync();
                out.close();
                return n;
            },
            "write " + tmp, max_attempts, cancel);

        if (!written.success) {
            rollback(path, had_original);
            return Result<void>::failure(written.error_kind,
                                         written.error_message.value_or("Failed to write " + tmp));
        }

        if (fail_point_.load() == FailPoint::AfterTempWrite) {
            warning() << "Simulated crash after writing " << tmp;
            return Result<void>::failure(ErrorKind::IoFailure, "Simulated crash after temp write");
        }

        cancel.throw_if_cancelled();
        replace(tmp, path);

        info() << "Saved " << path << " (" << *written.result << " bytes)";
    } catch (const std::exception&) {
        Error e = classify_exception(std::current_exception());
        if (e.kind != ErrorKind::Cancelled) {
            report(sink_, ErrorCategory::FileIO, Severity::Error,
                   "Save failed, rolling back", std::current_exception(), path);
        }
        rollback(path, had_original);
        return Result<void>::failure(e);
    }

    if (had_original && !config_.writer.keep_backup) {
        FSResult r = PlatformFS::remove_file(backup);
        if (!r.ok) {
            warning() << "Could not remove backup " << backup << ": " << errnoWithDescription(r.err);
        }
    }
    return Result<void>::success();
}

Result<void> AtomicWriter::save(const std::string& path,
                                std::string_view content,
                                const std::vector<Hyperlink>& hyperlinks,
                                const CancellationToken& cancel) {
    Result<void> valid = validate_path(path);
    if (!valid) {
        return valid;
    }

    std::string with_metadata;
    std::string_view data = content;
    if (!hyperlinks.empty()) {
        try {
            with_metadata = codec_->embed(content, hyperlinks);
        } catch (const std::exception&) {
            report(sink_, ErrorCategory::Memory, Severity::Error,
                   "Could not embed hyperlink metadata", std::current_exception(), path);
            return Result<void>::failure(classify_exception(std::current_exception()));
        }
        data = with_metadata;
    }

    Result<void> space = check_space(path, data.size());
    if (!space) {
        return space;
    }

    return commit(path,
                  [&](FileHandle& out, const CancellationToken& tok) {
                      LineWriter w(out, config_.writer, *memory_, tok);
                      w.write(data);
                      w.finish();
                      return w.bytes_written();
                  },
                  0, cancel);
}

Result<void> AtomicWriter::save_streaming(const std::string& path,
                                          PieceSource source,
                                          const std::vector<Hyperlink>& hyperlinks,
                                          uint64_t size_hint,
                                          const CancellationToken& cancel) {
    if (!source) {
        return Result<void>::failure(ErrorKind::InvalidInput, "Content source cannot be empty");
    }

    Result<void> valid = validate_path(path);
    if (!valid) {
        return valid;
    }

    Result<void> space = check_space(path, size_hint);
    if (!space) {
        return space;
    }

    return commit(path,
                  [&](FileHandle& out, const CancellationToken& tok) {
                      LineWriter w(out, config_.writer, *memory_, tok);
                      while (std::optional<std::string> piece = source()) {
                          w.write(*piece);
                      }
                      if (!hyperlinks.empty()) {
                          // embedding into empty content yields just the trailer
                          w.write(codec_->embed(std::string_view(), hyperlinks));
                      }
                      w.finish();
                      return w.bytes_written();
                  },
                  1, cancel);
}

std::future<Result<void>> AtomicWriter::save_async(std::string path,
                                                   std::string content,
                                                   std::vector<Hyperlink> hyperlinks,
                                                   CancellationToken cancel) {
    return std::async(std::launch::async,
                      [this, path = std::move(path), content = std::move(content),
                       hyperlinks = std::move(hyperlinks), cancel = std::move(cancel)]() {
                          return save(path, content, hyperlinks, cancel);
                      });
}

} // namespace persist
} // namespace textvault
