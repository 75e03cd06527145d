/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * SegmentStream: sequential chunked reads, boundary carry, progress and
 * cancellation
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <iterator>
#include <vector>

#include "segment_stream.h"
#include "chunk_reader.h"
#include "config.h"
#include "util/text_codec.h"
#include "persistence/test_helpers.h"

namespace textvault::persist::test {

class SegmentStreamTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string path_;

    void SetUp() override {
        test_dir_ = create_temp_dir("segment_stream");
        path_ = test_dir_ + "/input.txt";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    SegmentStream open(size_t chunk, ProgressCallback cb = nullptr,
                       CancellationToken cancel = CancellationToken(),
                       std::shared_ptr<const HyperlinkExtractor> ex = nullptr) {
        return SegmentStream(path_, chunk, std::move(ex), std::move(cb), std::move(cancel));
    }

    // The file decoded in one piece
    std::string decode_whole(const std::string& bytes) {
        return ChunkReader::build_segment(bytes.data(), bytes.size(), 0, nullptr).content;
    }

    void expect_covers_file(const std::vector<TextSegment>& segs, const std::string& bytes) {
        uint64_t expected_start = 0;
        std::string joined;
        for (const auto& s : segs) {
            EXPECT_EQ(s.start_position, expected_start);
            EXPECT_GT(s.length, 0u);
            expected_start = s.end_position();
            joined += s.content;
        }
        EXPECT_EQ(expected_start, bytes.size());
        EXPECT_EQ(joined, decode_whole(bytes));
    }
};

TEST_F(SegmentStreamTest, ConcatenationEqualsWholeFile) {
    std::string bytes = make_lines(200, 37);
    write_file(path_, bytes);

    SegmentStream s = open(64);
    std::vector<TextSegment> segs;
    for (const TextSegment& seg : s) {
        segs.push_back(seg);
    }

    EXPECT_TRUE(s.status().ok());
    EXPECT_TRUE(s.finished());
    EXPECT_EQ(segs.size(), (bytes.size() + 63) / 64);
    expect_covers_file(segs, bytes);
}

TEST_F(SegmentStreamTest, MultibyteAndCrLfNeverSplit) {
    // euro signs, emoji and CRLF pairs placed to straddle many chunk edges
    std::string bytes;
    for (int i = 0; i < 300; i++) {
        bytes += "\xE2\x82\xAC";
        bytes += (i % 3 == 0) ? "\r\n" : "x";
        bytes += "\xF0\x9F\x98\x80";
        if (i % 7 == 0) bytes += "\r";
    }
    write_file(path_, bytes);

    for (size_t chunk : {1u, 2u, 3u, 5u, 7u, 64u}) {
        SegmentStream s = open(chunk);
        std::vector<TextSegment> segs;
        while (auto seg = s.next()) {
            size_t bad = 0;
            text::decode_utf8(seg->content.data(), seg->content.size(), &bad);
            EXPECT_EQ(bad, 0u) << "chunk " << chunk << " at " << seg->start_position;
            segs.push_back(std::move(*seg));
        }
        ASSERT_TRUE(s.status().ok());
        expect_covers_file(segs, bytes);
    }
}

TEST_F(SegmentStreamTest, TrailingCarriageReturnIsEmitted) {
    std::string bytes = "abc\r";
    write_file(path_, bytes);

    SegmentStream s = open(2);
    std::vector<TextSegment> segs;
    while (auto seg = s.next()) segs.push_back(*seg);
    expect_covers_file(segs, bytes);
}

TEST_F(SegmentStreamTest, BomCoveredButNotEmitted) {
    std::string bytes = "\xEF\xBB\xBFhello world";
    write_file(path_, bytes);

    SegmentStream s = open(8);
    auto first = s.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->start_position, 0u);
    EXPECT_EQ(first->length, 8u);
    EXPECT_EQ(first->content, "hello");
}

TEST_F(SegmentStreamTest, EmptyFileYieldsNothing) {
    write_file(path_, "");
    int events = 0;
    SegmentStream s = open(16, [&events](const ProgressEvent&) { events++; });

    EXPECT_FALSE(s.next().has_value());
    EXPECT_TRUE(s.status().ok());
    EXPECT_EQ(events, 0);
    EXPECT_FALSE(s.next().has_value());
}

TEST_F(SegmentStreamTest, ProgressIsMonotonicAndCompletes) {
    std::string bytes = make_lines(50, 20);
    write_file(path_, bytes);

    std::vector<ProgressEvent> events;
    SegmentStream s = open(100, [&events](const ProgressEvent& p) { events.push_back(p); });
    while (s.next()) {}

    ASSERT_EQ(events.size(), 10u);
    uint64_t last = 0;
    for (const auto& e : events) {
        EXPECT_GE(e.processed_bytes, last);
        EXPECT_EQ(e.total_bytes, bytes.size());
        EXPECT_LE(e.percent_complete, 100.0);
        last = e.processed_bytes;
    }
    EXPECT_EQ(events.back().processed_bytes, bytes.size());
    EXPECT_DOUBLE_EQ(events.back().percent_complete, 100.0);
    EXPECT_EQ(s.processed_bytes(), bytes.size());
    EXPECT_EQ(s.total_bytes(), bytes.size());
}

TEST_F(SegmentStreamTest, CancellationStopsAfterNSegments) {
    write_file(path_, make_lines(1000, 32));

    CancellationSource src;
    SegmentStream s = open(64, nullptr, src.token());

    int seen = 0;
    while (auto seg = s.next()) {
        if (++seen == 3) {
            src.cancel();
        }
    }

    EXPECT_EQ(seen, 3);
    EXPECT_FALSE(s.status().ok());
    EXPECT_EQ(s.status().kind(), ErrorKind::Cancelled);
    EXPECT_TRUE(s.finished());
}

TEST_F(SegmentStreamTest, CancelledBeforeOpen) {
    write_file(path_, "data");
    CancellationSource src;
    src.cancel();

    SegmentStream s = open(64, nullptr, src.token());
    EXPECT_FALSE(s.next().has_value());
    EXPECT_EQ(s.status().kind(), ErrorKind::Cancelled);
}

TEST_F(SegmentStreamTest, MissingFileEndsWithNotFound) {
    path_ = test_dir_ + "/does_not_exist.txt";
    SegmentStream s = open(64);
    EXPECT_FALSE(s.next().has_value());
    EXPECT_EQ(s.status().kind(), ErrorKind::NotFound);
}

TEST_F(SegmentStreamTest, HyperlinksAreFileGlobal) {
    // 32-byte lines so no URL crosses a 64-byte chunk
    std::string bytes;
    for (int i = 0; i < 10; i++) {
        std::string line = "go https://x.io/" + std::to_string(i);
        line.resize(31, ' ');
        bytes += line + "\n";
    }
    write_file(path_, bytes);

    SegmentStream s = open(64, nullptr, CancellationToken(), std::make_shared<UrlPatternExtractor>());
    std::vector<Hyperlink> links;
    while (auto seg = s.next()) {
        links.insert(links.end(), seg->hyperlinks.begin(), seg->hyperlinks.end());
    }

    ASSERT_EQ(links.size(), 10u);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(links[i].start_index, i * 32 + 3);
        EXPECT_EQ(links[i].url, "https://x.io/" + std::to_string(i));
    }
}

TEST_F(SegmentStreamTest, UrlsSplitByChunksStayWhole) {
    // the first URL starts two bytes before the first chunk edge, inside "https://"
    std::string bytes;
    std::vector<std::string> urls;
    for (int i = 0; i < 40; i++) {
        size_t pad = i == 0 ? 61 : static_cast<size_t>((i * 13) % 70);
        std::string url = "https://example.com/item/" + std::to_string(i);
        bytes += std::string(pad, 'x') + " " + url + "\n";
        urls.push_back(url);
    }
    write_file(path_, bytes);
    ASSERT_EQ(bytes.compare(62, 8, "https://"), 0);

    SegmentStream s = open(64, nullptr, CancellationToken(), std::make_shared<CompositeExtractor>());
    std::vector<TextSegment> segs;
    std::vector<Hyperlink> links;
    while (auto seg = s.next()) {
        links.insert(links.end(), seg->hyperlinks.begin(), seg->hyperlinks.end());
        segs.push_back(std::move(*seg));
    }

    ASSERT_TRUE(s.status().ok());
    expect_covers_file(segs, bytes);
    ASSERT_EQ(links.size(), urls.size());
    for (size_t i = 0; i < urls.size(); i++) {
        EXPECT_EQ(links[i].url, urls[i]);
        EXPECT_EQ(bytes.compare(static_cast<size_t>(links[i].start_index), links[i].length, urls[i]), 0);
    }
}

TEST_F(SegmentStreamTest, LongRunWithoutSpacesIsStillSplit) {
    std::string bytes(3 * streaming::kMaxCarriedWordBytes, 'q');
    write_file(path_, bytes);

    SegmentStream s = open(512, nullptr, CancellationToken(), std::make_shared<UrlPatternExtractor>());
    std::vector<TextSegment> segs;
    while (auto seg = s.next()) {
        EXPECT_LE(seg->length, streaming::kMaxCarriedWordBytes + 512);
        segs.push_back(std::move(*seg));
    }
    EXPECT_GT(segs.size(), 1u);
    expect_covers_file(segs, bytes);
}

TEST_F(SegmentStreamTest, SavedTrailerStreamsBack) {
    const std::string content = make_lines(300, 30);      // 9000 bytes
    std::vector<Hyperlink> links;
    for (int i = 0; i < 120; i++) {
        Hyperlink h;
        h.start_index = i * 70 + 5;
        h.length = 4;
        h.url = "https://docs.example/page/" + std::to_string(i);
        h.display_text = content.substr(static_cast<size_t>(h.start_index), 4);
        links.push_back(h);
    }
    const std::string saved = CompositeExtractor().embed(content, links);
    write_file(path_, saved);
    // the JSON is several chunks long
    ASSERT_GT(saved.size() - content.size(), 4 * 1024u);

    std::vector<ProgressEvent> events;
    SegmentStream s = open(1024, [&events](const ProgressEvent& p) { events.push_back(p); },
                          CancellationToken(), std::make_shared<CompositeExtractor>());
    std::string joined;
    uint64_t covered = 0;
    std::vector<Hyperlink> back;
    while (auto seg = s.next()) {
        EXPECT_EQ(seg->start_position, covered);
        covered = seg->end_position();
        joined += seg->content;
        back.insert(back.end(), seg->hyperlinks.begin(), seg->hyperlinks.end());
    }

    ASSERT_TRUE(s.status().ok());
    EXPECT_EQ(covered, saved.size());
    EXPECT_EQ(joined, content.substr(0, content.size() - 1));
    EXPECT_EQ(back, links);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().processed_bytes, saved.size());
}

TEST_F(SegmentStreamTest, ZeroChunkSizeRejected) {
    EXPECT_THROW(open(0), std::invalid_argument);
}

TEST_F(SegmentStreamTest, EarlyDestructionReleasesFile) {
    write_file(path_, make_lines(100, 40));
    size_t open_before = std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                                       std::filesystem::directory_iterator());
    {
        SegmentStream s = open(64);
        ASSERT_TRUE(s.next().has_value());
    }
    size_t open_after = std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                                      std::filesystem::directory_iterator());
    EXPECT_EQ(open_after, open_before);
}

} // namespace textvault::persist::test
