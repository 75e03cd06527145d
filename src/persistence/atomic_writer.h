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
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../cancellation.h"
#include "../diagnostics.h"
#include "../engine_config.h"
#include "../errors.h"
#include "../hyperlink.h"
#include "../recovery/error_recovery.h"
#include "../recovery/memory_coordinator.h"
#include "file_handle.h"

namespace textvault {
namespace persist {

/**
 * Writes text line by line, rewriting "\r\n", "\r" and "\n" to `eol`.
 * Line breaks split across write() calls are handled. No terminator is
 * added after the last line.
 *
 * Buffered data is handed to the file every `flush_every_lines` lines (and
 * whenever the buffer passes kStreamBufferSize); cancellation is checked at
 * the same points. On std::bad_alloc the buffer is flushed, memory is
 * collected and the append is retried once.
 */
class LineWriter {
public:
    LineWriter(FileHandle& out, const WriterConfig& config, MemoryCoordinator& memory,
               const CancellationToken& cancel, std::string eol = files::kLineEnding);

    void write(std::string_view piece);
    void finish();

    uint64_t lines() const { return lines_; }
    uint64_t bytes_written() const { return bytes_; }

private:
    void append(const char* data, size_t len);
    void end_line();
    void flush();

    FileHandle& out_;
    const WriterConfig& config_;
    MemoryCoordinator& memory_;
    const CancellationToken& cancel_;
    std::string eol_;

    std::string buffer_;
    bool pending_cr_ = false;
    uint64_t lines_ = 0;
    uint64_t bytes_ = 0;
};

// Test-only failure injection.
enum class FailPoint {
    None,
    AfterTempWrite,     // abandon the save like a crash: temp and backup stay on disk
    DuringReplace       // fail the rename, exercising rollback
};

/**
 * AtomicWriter: replaces a file's content without ever exposing a partial
 * write at the destination.
 *
 * Protocol:
 *   1. validate the path and check free space (2x content, warn below 4x)
 *   2. copy an existing destination to <path>.backup
 *   3. write <path>.tmp (retried on transient errors) and fsync it
 *   4. rename <path>.tmp over <path>, fsync the directory
 *   5. remove the backup
 * A failure after step 2 restores <path> from the backup and removes the
 * temp file before the error is returned.
 */
class AtomicWriter {
public:
    // Pull source for save_streaming; nullopt ends the content.
    typedef std::function<std::optional<std::string>()> PieceSource;

    explicit AtomicWriter(EngineConfig config = EngineConfig::defaults(),
                          std::shared_ptr<const HyperlinkExtractor> codec = nullptr,
                          std::shared_ptr<MemoryCoordinator> memory = nullptr,
                          EventSink* sink = nullptr);

    Result<void> save(const std::string& path,
                      std::string_view content,
                      const std::vector<Hyperlink>& hyperlinks = {},
                      const CancellationToken& cancel = CancellationToken());

    /**
     * Like save() but content arrives in pieces and is never held whole.
     * `size_hint` feeds the free-space check (0 skips it). Not retried:
     * the source cannot be replayed.
     */
    Result<void> save_streaming(const std::string& path,
                                PieceSource source,
                                const std::vector<Hyperlink>& hyperlinks = {},
                                uint64_t size_hint = 0,
                                const CancellationToken& cancel = CancellationToken());

    std::future<Result<void>> save_async(std::string path,
                                         std::string content,
                                         std::vector<Hyperlink> hyperlinks = {},
                                         CancellationToken cancel = CancellationToken());

    void debug_set_fail_point(FailPoint fp) { fail_point_.store(fp); }

    static std::string backup_path(const std::string& path) { return path + files::kBackupSuffix; }
    static std::string temp_path(const std::string& path) { return path + files::kTempSuffix; }

    ErrorRecovery& recovery() { return recovery_; }

private:
    // Write the temp file; returns bytes written.
    typedef std::function<uint64_t(FileHandle&, const CancellationToken&)> TempWriter;

    Result<void> validate_path(const std::string& path) const;
    Result<void> check_space(const std::string& path, uint64_t bytes) const;
    Result<void> commit(const std::string& path,
                        const TempWriter& writer,
                        uint32_t max_attempts,
                        const CancellationToken& cancel);
    void replace(const std::string& tmp, const std::string& path);
    void rollback(const std::string& path, bool had_original);

    EngineConfig config_;
    std::shared_ptr<const HyperlinkExtractor> codec_;
    std::shared_ptr<MemoryCoordinator> memory_;
    EventSink* sink_;
    ErrorRecovery recovery_;
    std::atomic<FailPoint> fail_point_{FailPoint::None};
};

} // namespace persist
} // namespace textvault
