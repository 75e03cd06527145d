/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * End-to-end scenario: a large log-like file with embedded URLs is analyzed,
 * streamed, randomly accessed and copied through an atomic save.
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "file_analyzer.h"
#include "persistence/atomic_writer.h"
#include "streaming_engine.h"
#include "../persistence/test_helpers.h"

namespace textvault::persist::test {

namespace {

    constexpr size_t kLineLen = 128;

    std::string url_for(size_t n) {
        return "https://example.com/item/" + std::to_string(n);
    }

    // Fixed-length lines; every `url_every`-th line carries a URL until
    // `url_count` have been written.
    void write_scenario_file(const std::string& path, size_t lines, size_t url_every, size_t url_count,
                             size_t line_len = kLineLen) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        std::string line;
        size_t urls = 0;
        for (size_t i = 0; i < lines; i++) {
            line = "entry " + std::to_string(i);
            if (i % url_every == 0 && urls < url_count) {
                line += " see " + url_for(urls) + " for details";
                urls++;
            }
            line += ' ';
            while (line.size() < line_len - 1) {
                line.push_back(static_cast<char>('a' + (line.size() % 26)));
            }
            line.push_back('\n');
            out.write(line.data(), static_cast<std::streamsize>(line.size()));
        }
    }

} // namespace

class LargeFileScenarioTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string source_;

    void SetUp() override {
        test_dir_ = create_temp_dir("large_file_scenario");
        source_ = test_dir_ + "/big.log";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static EngineConfig scaled_config() {
        EngineConfig cfg = EngineConfig::defaults();
        cfg.chunk_size = 8192;
        cfg.large_threshold = 100 * 1024;
        cfg.streaming_threshold = 500 * 1024;
        cfg.safety_threshold = 5 * 1024 * 1024;
        cfg.recovery.base_delay = std::chrono::milliseconds(1);
        cfg.recovery.max_delay = std::chrono::milliseconds(5);
        return cfg;
    }

    struct StreamSummary {
        std::string content;
        std::vector<Hyperlink> links;
        std::vector<double> progress;
        size_t segments = 0;
    };

    static StreamSummary stream_all(const StreamingEngine& engine, const std::string& path) {
        StreamSummary sum;
        SegmentStream s = engine.stream(path, [&sum](const ProgressEvent& ev) {
            sum.progress.push_back(ev.percent_complete);
        });
        for (const TextSegment& seg : s) {
            sum.content += seg.content;
            sum.links.insert(sum.links.end(), seg.hyperlinks.begin(), seg.hyperlinks.end());
            sum.segments++;
        }
        EXPECT_TRUE(s.status().ok()) << s.status().error().message;
        return sum;
    }
};

TEST_F(LargeFileScenarioTest, ScaledScenario) {
    const size_t lines = 9600;   // ~1.2MB
    write_scenario_file(source_, lines, 9, 1000);
    const std::string original = read_file(source_);
    ASSERT_EQ(original.size(), lines * kLineLen);

    EngineConfig cfg = scaled_config();

    // analysis
    FileAnalyzer analyzer(cfg);
    Result<StreamingFileInfo> fi = analyzer.analyze(source_);
    ASSERT_TRUE(fi.ok()) << fi.error().message;
    EXPECT_EQ(fi->category, SizeCategory::VeryLarge);
    EXPECT_EQ(fi->recommendation, LoadRecommendation::Streaming);
    EXPECT_TRUE(fi->requires_streaming);
    EXPECT_TRUE(fi->is_large_file);
    EXPECT_FALSE(fi->exceeds_safety_threshold);
    EXPECT_NEAR(static_cast<double>(fi->estimated_line_count), static_cast<double>(lines), lines * 0.05);

    // sequential streaming
    StreamingEngine engine(cfg);
    StreamSummary sum = stream_all(engine, source_);
    EXPECT_EQ(sum.content, original);
    EXPECT_EQ(sum.segments, (original.size() + cfg.chunk_size - 1) / cfg.chunk_size);
    ASSERT_EQ(sum.links.size(), 1000u);
    for (size_t i = 0; i < sum.links.size(); i++) {
        const Hyperlink& h = sum.links[i];
        EXPECT_EQ(h.url, url_for(i));
        EXPECT_EQ(original.compare(static_cast<size_t>(h.start_index), h.length, h.url), 0);
    }

    ASSERT_FALSE(sum.progress.empty());
    EXPECT_DOUBLE_EQ(sum.progress.back(), 100.0);
    for (size_t i = 1; i < sum.progress.size(); i++) {
        EXPECT_GE(sum.progress[i], sum.progress[i - 1]);
    }

    // random access with caching
    ASSERT_TRUE(engine.open(source_).ok());
    const uint64_t offset = 3 * cfg.chunk_size;
    Result<TextSegment> a = engine.load_segment(offset, cfg.chunk_size);
    Result<TextSegment> b = engine.load_segment(offset, cfg.chunk_size);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a->content, original.substr(offset, cfg.chunk_size));
    EXPECT_EQ(b->content, a->content);
    EXPECT_EQ(engine.disk_reads(), 1u);

    // search
    Result<std::vector<TextSegment>> hits = engine.search(source_, url_for(500) + " ");
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NE(hits->front().content.find(url_for(500)), std::string::npos);

    // copy through an atomic save, carrying the links in a trailer
    const std::string copy = test_dir_ + "/copy.log";
    AtomicWriter writer(cfg);
    SegmentStream s = engine.stream(source_);
    Result<void> saved = writer.save_streaming(
        copy,
        [&s]() -> std::optional<std::string> {
            std::optional<TextSegment> seg = s.next();
            if (!seg) return std::nullopt;
            return std::move(seg->content);
        },
        sum.links, original.size());
    ASSERT_TRUE(saved.ok()) << saved.error().message;
    ASSERT_TRUE(s.status().ok());

    const std::string saved_bytes = read_file(copy);
    Extraction back = MetadataTrailerExtractor().extract(saved_bytes);
    // whitespace before the trailer is not part of the content
    EXPECT_EQ(back.clean_text, original.substr(0, original.size() - 1));
    EXPECT_EQ(back.hyperlinks, sum.links);

    // streaming the copy brings the stored links back at their own indices
    StreamSummary again = stream_all(engine, copy);
    EXPECT_EQ(again.content, back.clean_text);
    EXPECT_EQ(again.links, sum.links);
    EXPECT_DOUBLE_EQ(again.progress.back(), 100.0);

    ASSERT_TRUE(engine.open(copy).ok());
    Result<TextSegment> mid = engine.load_segment(offset, cfg.chunk_size);
    ASSERT_TRUE(mid.ok());
    for (const Hyperlink& h : mid->hyperlinks) {
        EXPECT_EQ(back.clean_text.compare(static_cast<size_t>(h.start_index), h.length, h.display_text), 0);
    }
}

TEST_F(LargeFileScenarioTest, UrlsAcrossChunkBoundaries) {
    // 100-byte lines put URLs across 8KB chunk edges, some inside the scheme
    const size_t line_len = 100;
    const size_t lines = 9000;
    write_scenario_file(source_, lines, 9, 1000, line_len);
    const std::string original = read_file(source_);
    ASSERT_EQ(original.size(), lines * line_len);

    EngineConfig cfg = scaled_config();
    size_t split = 0;
    for (size_t n = 0; n < 1000; n++) {
        size_t at = original.find(url_for(n) + " ");
        ASSERT_NE(at, std::string::npos);
        if (at / cfg.chunk_size != (at + url_for(n).size() - 1) / cfg.chunk_size) split++;
    }
    ASSERT_GT(split, 0u);

    StreamingEngine engine(cfg);
    StreamSummary sum = stream_all(engine, source_);
    EXPECT_EQ(sum.content, original);
    ASSERT_EQ(sum.links.size(), 1000u);
    for (size_t i = 0; i < sum.links.size(); i++) {
        const Hyperlink& h = sum.links[i];
        EXPECT_EQ(h.url, url_for(i));
        EXPECT_EQ(original.compare(static_cast<size_t>(h.start_index), h.length, h.url), 0);
        if (i > 0) {
            EXPECT_GE(h.start_index, sum.links[i - 1].end_index());
        }
    }
}

TEST_F(LargeFileScenarioTest, CancelMidStream) {
    write_scenario_file(source_, 9600, 9, 1000);

    StreamingEngine engine(scaled_config());
    CancellationSource src;
    SegmentStream s = engine.stream(source_, nullptr, src.token());

    size_t seen = 0;
    while (std::optional<TextSegment> seg = s.next()) {
        if (++seen == 10) src.cancel();
    }

    EXPECT_EQ(seen, 10u);
    EXPECT_EQ(s.status().kind(), ErrorKind::Cancelled);
    EXPECT_LT(s.processed_bytes(), s.total_bytes());
}

// Past the default 50MB streaming threshold with 1000 URLs; large chunks
// keep the segment count small.
TEST_F(LargeFileScenarioTest, DefaultThresholdScenario) {
    const size_t line_len = 100;
    const size_t lines = (52ULL * 1024 * 1024) / line_len;
    write_scenario_file(source_, lines, lines / 1000, 1000, line_len);

    FileAnalyzer analyzer;
    Result<StreamingFileInfo> fi = analyzer.analyze(source_);
    ASSERT_TRUE(fi.ok()) << fi.error().message;
    EXPECT_EQ(fi->file_size, lines * line_len);
    EXPECT_TRUE(fi->is_large_file);
    EXPECT_TRUE(fi->requires_streaming);
    EXPECT_EQ(fi->recommendation, LoadRecommendation::Streaming);

    EngineConfig cfg = EngineConfig::defaults();
    cfg.chunk_size = 1024 * 1024;
    StreamingEngine engine(cfg);
    SegmentStream s = engine.stream(source_);
    std::vector<Hyperlink> links;
    uint64_t bytes = 0;
    size_t segments = 0;
    for (const TextSegment& seg : s) {
        links.insert(links.end(), seg.hyperlinks.begin(), seg.hyperlinks.end());
        bytes += seg.length;
        segments++;
    }
    EXPECT_TRUE(s.status().ok());
    EXPECT_EQ(bytes, fi->file_size);
    EXPECT_LE(segments, 53u);
    ASSERT_EQ(links.size(), 1000u);
    for (size_t i = 0; i < links.size(); i++) {
        EXPECT_EQ(links[i].url, url_for(i));
        if (i > 0) {
            EXPECT_GE(links[i].start_index, links[i - 1].end_index());
        }
    }
}

} // namespace textvault::persist::test
