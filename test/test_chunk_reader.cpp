#include <gtest/gtest.h>
#include "gzsplit/core/ChunkReader.hpp"
#include "TestHelpers.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace GzSplit;
using namespace GzSplitTest;

TEST(ChunkReaderTest, SplitsIntoFixedChunks) {
    std::istringstream in(makePayload(10));
    IStreamSourceStream source(in);
    ChunkReader reader(source, 4);

    std::vector<size_t> sizes;
    while (true) {
        ChunkEvent event = reader.next();
        if (isEndOfStream(event)) break;
        sizes.push_back(std::get<DataChunk>(event).bytes.size());
    }
    EXPECT_EQ(sizes, (std::vector<size_t>{4, 4, 2}));
    EXPECT_EQ(reader.bytesRead(), 10u);
    EXPECT_TRUE(reader.exhausted());
}

TEST(ChunkReaderTest, ShortReadIsForwardedNotTreatedAsEnd) {
    std::string data = makePayload(20);
    ScriptedSource source(data, {3, 1, 16});
    ChunkReader reader(source, 8);

    std::string collected;
    std::vector<size_t> sizes;
    while (true) {
        ChunkEvent event = reader.next();
        if (isEndOfStream(event)) break;
        const auto& bytes = std::get<DataChunk>(event).bytes;
        sizes.push_back(bytes.size());
        collected += toString(bytes);
    }
    EXPECT_EQ(sizes, (std::vector<size_t>{3, 1, 8, 8}));
    EXPECT_EQ(collected, data);
}

TEST(ChunkReaderTest, EmptySourceYieldsEndOfStreamImmediately) {
    std::istringstream in("");
    IStreamSourceStream source(in);
    ChunkReader reader(source, 8);

    EXPECT_TRUE(isEndOfStream(reader.next()));
    // Stays exhausted
    EXPECT_TRUE(isEndOfStream(reader.next()));
    EXPECT_EQ(reader.bytesRead(), 0u);
}

TEST(ChunkReaderTest, ReadFailurePropagates) {
    FailingSource source(5);
    ChunkReader reader(source, 4);
    EXPECT_FALSE(isEndOfStream(reader.next()));
    EXPECT_FALSE(isEndOfStream(reader.next()));
    EXPECT_THROW(reader.next(), SourceReadError);
}

TEST(ChunkReaderTest, ZeroChunkSizeRejected) {
    std::istringstream in("abc");
    IStreamSourceStream source(in);
    EXPECT_THROW(ChunkReader(source, 0), std::invalid_argument);
}

TEST(FileSourceStreamTest, ReadsFileAndReportsMissingFile) {
    std::string path = ::testing::TempDir() + "gzsplit_source_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "hello world";
    }
    FileSourceStream source(path);
    ChunkReader reader(source, 64);
    ChunkEvent event = reader.next();
    ASSERT_FALSE(isEndOfStream(event));
    EXPECT_EQ(toString(std::get<DataChunk>(event).bytes), "hello world");
    EXPECT_TRUE(isEndOfStream(reader.next()));
    std::remove(path.c_str());

    EXPECT_THROW(FileSourceStream("/nonexistent/gzsplit/input.csv"), SourceReadError);
}
