/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * AtomicWriter: temp-write-rename saves, backups, rollback, and the
 * line-ending normalizing LineWriter
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <optional>
#include <vector>

#include "persistence/atomic_writer.h"
#include "test_helpers.h"

namespace textvault::persist::test {

using ::testing::Field;

class AtomicWriterTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string target_;
    const std::string eol_ = files::kLineEnding;

    void SetUp() override {
        test_dir_ = create_temp_dir("atomic_writer");
        target_ = test_dir_ + "/doc.txt";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static EngineConfig fast_config() {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.recovery.base_delay = std::chrono::milliseconds(1);
        cfg.recovery.max_delay = std::chrono::milliseconds(5);
        return cfg;
    }

    static Hyperlink link(int64_t start, int32_t length, const std::string& url, const std::string& text) {
        Hyperlink h;
        h.start_index = start;
        h.length = length;
        h.url = url;
        h.display_text = text;
        return h;
    }

    // Serves the given pieces in order
    static AtomicWriter::PieceSource pieces(std::vector<std::string> parts) {
        auto idx = std::make_shared<size_t>(0);
        auto data = std::make_shared<std::vector<std::string>>(std::move(parts));
        return [idx, data]() -> std::optional<std::string> {
            if (*idx >= data->size()) return std::nullopt;
            return (*data)[(*idx)++];
        };
    }

    bool exists(const std::string& p) const { return std::filesystem::exists(p); }
};

// ============= save =============

TEST_F(AtomicWriterTest, SaveNewFile) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save(target_, "first" + eol_ + "second");
    ASSERT_TRUE(r.ok()) << r.error().message;

    // no terminator is added after the last line
    EXPECT_EQ(read_file(target_), "first" + eol_ + "second");
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
    EXPECT_FALSE(exists(AtomicWriter::backup_path(target_)));
}

TEST_F(AtomicWriterTest, SaveKeepsFinalTerminator) {
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "only line\n").ok());
    EXPECT_EQ(read_file(target_), "only line" + eol_);
}

TEST_F(AtomicWriterTest, SaveNormalizesLineEndings) {
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "a\r\nb\rc\nd").ok());
    EXPECT_EQ(read_file(target_), "a" + eol_ + "b" + eol_ + "c" + eol_ + "d");
}

TEST_F(AtomicWriterTest, SaveEmptyContent) {
    write_file(target_, "previous");
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "").ok());
    EXPECT_EQ(read_file(target_), "");
}

TEST_F(AtomicWriterTest, SaveEmbedsHyperlinkTrailer) {
    std::vector<Hyperlink> links = {
        link(0, 5, "https://example.com/a", "Hello"),
        link(6, 5, "https://example.com/\"b\"", "world")
    };

    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "Hello world", links).ok());

    std::string on_disk = read_file(target_);
    EXPECT_NE(on_disk.find(MetadataTrailerExtractor::kStartMarker), std::string::npos);

    Extraction back = MetadataTrailerExtractor().extract(on_disk);
    EXPECT_EQ(back.clean_text, "Hello world");
    EXPECT_EQ(back.hyperlinks, links);
}

TEST_F(AtomicWriterTest, SaveReplacesExistingTrailer) {
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "text", {link(0, 4, "http://one", "text")}).ok());

    std::string first = read_file(target_);
    ASSERT_TRUE(writer.save(target_, first, {link(0, 4, "http://two", "text")}).ok());

    Extraction back = MetadataTrailerExtractor().extract(read_file(target_));
    EXPECT_EQ(back.clean_text, "text");
    ASSERT_EQ(back.hyperlinks.size(), 1u);
    EXPECT_EQ(back.hyperlinks[0].url, "http://two");
}

TEST_F(AtomicWriterTest, BackupRemovedAfterSuccess) {
    write_file(target_, "old");
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save(target_, "new").ok());

    EXPECT_EQ(read_file(target_), "new");
    EXPECT_FALSE(exists(AtomicWriter::backup_path(target_)));
}

TEST_F(AtomicWriterTest, BackupKeptWhenConfigured) {
    write_file(target_, "old");
    EngineConfig cfg = fast_config();
    cfg.writer.keep_backup = true;
    AtomicWriter writer(cfg);
    ASSERT_TRUE(writer.save(target_, "new").ok());

    EXPECT_EQ(read_file(target_), "new");
    EXPECT_EQ(read_file(AtomicWriter::backup_path(target_)), "old");
}

// ============= validation =============

TEST_F(AtomicWriterTest, EmptyPathRejected) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save("", "x");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::InvalidInput);
}

TEST_F(AtomicWriterTest, DirectoryTargetRejected) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save(test_dir_, "x");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::InvalidInput);
}

TEST_F(AtomicWriterTest, MissingParentIsNotFound) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save(test_dir_ + "/no/such/dir/out.txt", "x");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::NotFound);
}

TEST_F(AtomicWriterTest, InsufficientSpaceReported) {
    MockEventSink sink;
    EXPECT_CALL(sink, on_event(Field(&ErrorEvent::severity, Severity::Error))).Times(1);

    AtomicWriter writer(fast_config(), nullptr, nullptr, &sink);
    Result<void> r = writer.save_streaming(target_, pieces({"x"}), {}, uint64_t(1) << 60);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::InsufficientSpace);
    EXPECT_FALSE(exists(target_));
}

TEST_F(AtomicWriterTest, InvalidConfigRejected) {
    EngineConfig cfg = fast_config();
    cfg.chunk_size = 0;
    EXPECT_THROW(AtomicWriter writer(cfg), std::invalid_argument);
}

// ============= cancellation and rollback =============

TEST_F(AtomicWriterTest, CancelledBeforeCommitLeavesFileUntouched) {
    write_file(target_, "original");
    CancellationSource src;
    src.cancel();

    AtomicWriter writer(fast_config());
    Result<void> r = writer.save(target_, "replacement", {}, src.token());
    EXPECT_EQ(r.kind(), ErrorKind::Cancelled);
    EXPECT_EQ(read_file(target_), "original");
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
    EXPECT_FALSE(exists(AtomicWriter::backup_path(target_)));
}

TEST_F(AtomicWriterTest, CancelledMidStreamRollsBack) {
    write_file(target_, "original");
    EngineConfig cfg = fast_config();
    cfg.writer.flush_every_lines = 1;
    AtomicWriter writer(cfg);

    CancellationSource src;
    int served = 0;
    Result<void> r = writer.save_streaming(
        target_,
        [&]() -> std::optional<std::string> {
            if (++served == 2) src.cancel();
            if (served > 100) return std::nullopt;
            return std::string("line\n");
        },
        {}, 0, src.token());

    EXPECT_EQ(r.kind(), ErrorKind::Cancelled);
    EXPECT_LT(served, 100);
    EXPECT_EQ(read_file(target_), "original");
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
    EXPECT_FALSE(exists(AtomicWriter::backup_path(target_)));
}

TEST_F(AtomicWriterTest, ReplaceFailureRestoresOriginal) {
    write_file(target_, "original");
    RecordingSink sink;
    AtomicWriter writer(fast_config(), nullptr, nullptr, &sink);
    writer.debug_set_fail_point(FailPoint::DuringReplace);

    Result<void> r = writer.save(target_, "replacement");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::IoFailure);
    EXPECT_EQ(r.error().code, EIO);

    EXPECT_EQ(read_file(target_), "original");
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
    EXPECT_FALSE(exists(AtomicWriter::backup_path(target_)));
    EXPECT_GE(sink.count(Severity::Error), 1u);
}

TEST_F(AtomicWriterTest, ReplaceFailureOnNewFileLeavesNothing) {
    AtomicWriter writer(fast_config());
    writer.debug_set_fail_point(FailPoint::DuringReplace);

    EXPECT_FALSE(writer.save(target_, "content").ok());
    EXPECT_FALSE(exists(target_));
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
}

// ============= save_streaming =============

TEST_F(AtomicWriterTest, StreamingJoinsLineBreaksAcrossPieces) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save_streaming(target_, pieces({"a\r", "\nb\r", "c", "\r\n", "d"}));
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(read_file(target_), "a" + eol_ + "b" + eol_ + "c" + eol_ + "d");
}

TEST_F(AtomicWriterTest, StreamingAppendsTrailer) {
    std::vector<Hyperlink> links = {link(4, 3, "http://x.test", "two")};
    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save_streaming(target_, pieces({"one ", "two"}), links, 7).ok());

    Extraction back = MetadataTrailerExtractor().extract(read_file(target_));
    EXPECT_EQ(back.clean_text, "one two");
    EXPECT_EQ(back.hyperlinks, links);
}

TEST_F(AtomicWriterTest, StreamingLargeContent) {
    const std::string lines = make_lines(20000, 50);
    std::vector<std::string> parts;
    for (size_t off = 0; off < lines.size(); off += 4093) {
        parts.push_back(lines.substr(off, 4093));
    }

    AtomicWriter writer(fast_config());
    ASSERT_TRUE(writer.save_streaming(target_, pieces(parts), {}, lines.size()).ok());
    EXPECT_EQ(read_file(target_), lines);
}

TEST_F(AtomicWriterTest, StreamingRejectsEmptySource) {
    AtomicWriter writer(fast_config());
    Result<void> r = writer.save_streaming(target_, nullptr);
    EXPECT_EQ(r.kind(), ErrorKind::InvalidInput);
}

TEST_F(AtomicWriterTest, StreamingSourceFailureRollsBack) {
    write_file(target_, "original");
    AtomicWriter writer(fast_config());

    int served = 0;
    Result<void> r = writer.save_streaming(target_, [&]() -> std::optional<std::string> {
        if (++served > 2) throw std::runtime_error("upstream read failed");
        return std::string("chunk\n");
    });

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(served, 3);   // not retried
    EXPECT_EQ(read_file(target_), "original");
    EXPECT_FALSE(exists(AtomicWriter::temp_path(target_)));
}

// ============= save_async =============

TEST_F(AtomicWriterTest, SaveAsync) {
    AtomicWriter writer(fast_config());
    auto fut = writer.save_async(target_, "async body");
    Result<void> r = fut.get();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(read_file(target_), "async body");
}

TEST_F(AtomicWriterTest, ConcurrentAsyncSavesToDistinctFiles) {
    AtomicWriter writer(fast_config());
    std::vector<std::future<Result<void>>> futures;
    for (int i = 0; i < 8; i++) {
        futures.push_back(writer.save_async(test_dir_ + "/f" + std::to_string(i), "body " + std::to_string(i)));
    }
    for (int i = 0; i < 8; i++) {
        EXPECT_TRUE(futures[i].get().ok());
        EXPECT_EQ(read_file(test_dir_ + "/f" + std::to_string(i)), "body " + std::to_string(i));
    }
}

// ============= LineWriter =============

class LineWriterTest : public AtomicWriterTest {
protected:
    MemoryCoordinator memory_;
    WriterConfig config_;
};

TEST_F(LineWriterTest, FlushesEveryNLines) {
    config_.flush_every_lines = 3;
    FileHandle out = FileHandle::open_write(target_);
    CancellationToken none;
    LineWriter w(out, config_, memory_, none, "\n");

    w.write("a\nb\n");
    EXPECT_EQ(read_file(target_), "");
    w.write("c\nd");
    EXPECT_EQ(read_file(target_), "a\nb\nc\n");
    EXPECT_EQ(w.lines(), 3u);

    w.finish();
    EXPECT_EQ(read_file(target_), "a\nb\nc\nd");
    EXPECT_EQ(w.bytes_written(), 7u);
}

TEST_F(LineWriterTest, CustomTerminator) {
    FileHandle out = FileHandle::open_write(target_);
    CancellationToken none;
    LineWriter w(out, config_, memory_, none, "\r\n");

    w.write("x\ny\rz\r");
    w.write("\n");
    w.finish();
    out.close();

    EXPECT_EQ(read_file(target_), "x\r\ny\r\nz\r\n");
    EXPECT_EQ(w.lines(), 3u);
}

TEST_F(LineWriterTest, CancellationCheckedAtFlush) {
    config_.flush_every_lines = 2;
    FileHandle out = FileHandle::open_write(target_);
    CancellationSource src;
    CancellationToken tok = src.token();
    LineWriter w(out, config_, memory_, tok, "\n");

    w.write("one\n");
    src.cancel();
    EXPECT_THROW(w.write("two\n"), OperationCancelled);
}

} // namespace textvault::persist::test
