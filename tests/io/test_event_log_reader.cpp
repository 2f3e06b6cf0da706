#include <gtest/gtest.h>
#include "io/binary_file_sink.h"
#include "io/event_log_reader.h"
#include "io/event_log_format.h"
#include "core/records.h"

#include <cstdio>
#include <string>
#include <vector>

#include <unistd.h>

namespace flowbench {
namespace test {

static FlowMeta makeReceiverMeta() {
    FlowMeta m;
    m.flow_id = 7;
    m.role    = LogRole::RECEIVER;
    m.mode    = TransportMode::STREAM;
    m.cca     = "cubic";
    return m;
}

/// Helper: write N receive records via BinaryFileSink and return them for comparison.
static std::vector<EventRecord> writeTestFile(const std::string& path, int n,
                                              uint32_t chunk_cap = 8) {
    std::vector<EventRecord> records;
    BinaryFileSink sink(path, makeReceiverMeta(), chunk_cap);
    for (int i = 0; i < n; ++i) {
        auto rec = makeRecvRecord(7, static_cast<uint64_t>(i), TransportMode::STREAM,
                                  1000 + static_cast<uint32_t>(i), i * 1000000ULL, 0);
        records.push_back(rec);
        sink.append(rec);
    }
    sink.close();
    return records;
}

class EventLogReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = testing::TempDir() + "test_reader_" +
                std::to_string(reinterpret_cast<uintptr_t>(this)) + ".fblog";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

// --- Constructor / Header ---

TEST_F(EventLogReaderTest, ParsesHeaderAndMeta) {
    writeTestFile(path_, 10);
    EventLogReader reader(path_);

    const auto& hdr = reader.header();
    EXPECT_TRUE(validateMagic(hdr));
    EXPECT_EQ(hdr.version_major, kLogVersionMajor);
    EXPECT_EQ(hdr.record_size, sizeof(EventRecord));

    const FlowMeta meta = reader.meta();
    EXPECT_EQ(meta.flow_id, 7u);
    EXPECT_EQ(meta.role, LogRole::RECEIVER);
    EXPECT_EQ(meta.mode, TransportMode::STREAM);
    EXPECT_EQ(meta.cca, "cubic");
    EXPECT_FALSE(reader.recovered());
}

TEST_F(EventLogReaderTest, ThrowsOnMissingFile) {
    EXPECT_THROW(EventLogReader("/nonexistent/path.fblog"), std::runtime_error);
}

TEST_F(EventLogReaderTest, ThrowsOnBadMagic) {
    std::FILE* f = std::fopen(path_.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    const char garbage[64] = {0};
    std::fwrite(garbage, 1, 64, f);
    std::fclose(f);

    EXPECT_THROW({ EventLogReader r(path_); }, std::runtime_error);
}

TEST_F(EventLogReaderTest, ThrowsOnShortFile) {
    std::FILE* f = std::fopen(path_.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    std::fwrite("FBENCHLG", 1, 8, f);
    std::fclose(f);

    EXPECT_THROW({ EventLogReader r(path_); }, std::runtime_error);
}

// --- Chunks ---

TEST_F(EventLogReaderTest, EmptyFileHasNoChunks) {
    writeTestFile(path_, 0);
    EventLogReader reader(path_);
    EXPECT_EQ(reader.chunkCount(), 0u);
    EXPECT_EQ(reader.totalRecords(), 0u);
    EXPECT_TRUE(reader.readAll().empty());
}

TEST_F(EventLogReaderTest, ChunkCountMatchesWriter) {
    writeTestFile(path_, 25, 8);  // 3 full + 1 partial = 4 chunks
    EventLogReader reader(path_);
    EXPECT_EQ(reader.chunkCount(), 4u);
    EXPECT_EQ(reader.totalRecords(), 25u);
}

TEST_F(EventLogReaderTest, ReadLastPartialChunk) {
    auto originals = writeTestFile(path_, 25, 8);
    EventLogReader reader(path_);

    auto chunk = reader.readChunk(3);
    ASSERT_EQ(chunk.size(), 1u);
    EXPECT_EQ(chunk[0].seq, originals[24].seq);
    EXPECT_EQ(chunk[0].ts_ns, originals[24].ts_ns);
}

TEST_F(EventLogReaderTest, ReadChunkOutOfRangeThrows) {
    writeTestFile(path_, 10, 8);
    EventLogReader reader(path_);
    EXPECT_THROW(reader.readChunk(99), std::out_of_range);
}

TEST_F(EventLogReaderTest, ReadAllMatchesWrittenRecords) {
    auto originals = writeTestFile(path_, 50, 8);
    EventLogReader reader(path_);

    auto all = reader.readAll();
    ASSERT_EQ(all.size(), 50u);
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].seq, originals[i].seq)       << "record " << i;
        EXPECT_EQ(all[i].ts_ns, originals[i].ts_ns)   << "record " << i;
        EXPECT_EQ(all[i].bytes, originals[i].bytes)   << "record " << i;
        EXPECT_EQ(all[i].kind, static_cast<uint8_t>(EventKind::RECV)) << "record " << i;
    }
}

// --- Sequence lookups ---

TEST_F(EventLogReaderTest, SeqRangeReadsOnlyOverlappingChunks) {
    writeTestFile(path_, 40, 8);   // chunk k holds seq 8k..8k+7
    EventLogReader reader(path_);

    ASSERT_EQ(reader.index().size(), 5u);
    EXPECT_EQ(reader.index()[2].span.min_seq, 16u);
    EXPECT_EQ(reader.index()[2].span.max_seq, 23u);

    auto range = reader.readSeqRange(14, 18);
    ASSERT_EQ(range.size(), 5u);
    for (size_t i = 0; i < range.size(); ++i)
        EXPECT_EQ(range[i].seq, 14 + i);

    EXPECT_TRUE(reader.readSeqRange(100, 200).empty());
}

TEST_F(EventLogReaderTest, SeqRangeKeepsDuplicatesAndFileOrder) {
    {
        BinaryFileSink sink(path_, makeReceiverMeta(), 3);
        for (uint64_t seq : {4u, 1u, 4u, 2u, 9u, 3u})
            sink.append(makeRecvRecord(7, seq, TransportMode::DATAGRAM, 100, seq * 10, seq));
        sink.close();
    }
    EventLogReader reader(path_);
    auto range = reader.readSeqRange(2, 4);
    ASSERT_EQ(range.size(), 4u);
    EXPECT_EQ(range[0].seq, 4u);
    EXPECT_EQ(range[1].seq, 4u);
    EXPECT_EQ(range[2].seq, 2u);
    EXPECT_EQ(range[3].seq, 3u);
}

TEST_F(EventLogReaderTest, DroppedTotalComesFromTheIndex) {
    {
        FlowMeta m = makeReceiverMeta();
        m.role = LogRole::SENDER;
        BinaryFileSink sink(path_, m, 4);
        for (uint64_t i = 0; i < 10; ++i) {
            const SendStatus st = (i % 3 == 0) ? SendStatus::DROPPED : SendStatus::OK;
            sink.append(makeSendRecord(7, i, TransportMode::DATAGRAM, 100, i, i, st));
        }
        sink.close();
    }
    EventLogReader reader(path_);
    EXPECT_EQ(reader.totalDropped(), 4u);   // seq 0, 3, 6, 9
}

// --- Crash recovery ---
// A writer killed before close leaves no index and no HAS_INDEX flag; the
// reader rebuilds the index by scanning chunk headers.

TEST_F(EventLogReaderTest, WorksWithoutIndexFooter) {
    auto originals = writeTestFile(path_, 16, 8);

    std::FILE* f = std::fopen(path_.c_str(), "r+b");
    ASSERT_NE(f, nullptr);

    FileHeader hdr{};
    ASSERT_EQ(std::fread(&hdr, sizeof(hdr), 1, f), 1u);
    ASSERT_NE(hdr.header_flags & kHeaderFlagHasIndex, 0u);

    std::fseek(f, -static_cast<long>(sizeof(IndexTail)), SEEK_END);
    IndexTail tail{};
    ASSERT_EQ(std::fread(&tail, sizeof(tail), 1, f), 1u);
    const long data_end = static_cast<long>(tail.index_start_offset);

    hdr.header_flags = 0;
    std::fseek(f, 0, SEEK_SET);
    ASSERT_EQ(std::fwrite(&hdr, sizeof(hdr), 1, f), 1u);
    std::fclose(f);

    ASSERT_EQ(truncate(path_.c_str(), data_end), 0);

    EventLogReader reader(path_);
    EXPECT_TRUE(reader.recovered());
    EXPECT_EQ(reader.chunkCount(), 2u);
    EXPECT_EQ(reader.totalRecords(), 16u);

    auto all = reader.readAll();
    ASSERT_EQ(all.size(), 16u);
    for (size_t i = 0; i < all.size(); ++i)
        EXPECT_EQ(all[i].seq, originals[i].seq) << "record " << i;
}

TEST_F(EventLogReaderTest, ScanStopsAtTornChunk) {
    writeTestFile(path_, 24, 8);   // 3 chunks

    long third_chunk_offset = 0;
    {
        EventLogReader reader(path_);
        ASSERT_EQ(reader.chunkCount(), 3u);
        third_chunk_offset = static_cast<long>(reader.index()[2].file_offset);
    }

    std::FILE* f = std::fopen(path_.c_str(), "r+b");
    ASSERT_NE(f, nullptr);
    FileHeader hdr{};
    ASSERT_EQ(std::fread(&hdr, sizeof(hdr), 1, f), 1u);
    hdr.header_flags = 0;
    std::fseek(f, 0, SEEK_SET);
    ASSERT_EQ(std::fwrite(&hdr, sizeof(hdr), 1, f), 1u);
    std::fclose(f);

    // Keep the third chunk's header and a few payload bytes only.
    ASSERT_EQ(truncate(path_.c_str(),
                       third_chunk_offset + static_cast<long>(sizeof(ChunkHeader)) + 3), 0);

    EventLogReader reader(path_);
    EXPECT_TRUE(reader.recovered());
    EXPECT_EQ(reader.chunkCount(), 2u);
    EXPECT_EQ(reader.readAll().size(), 16u);
}

}  // namespace test
}  // namespace flowbench
