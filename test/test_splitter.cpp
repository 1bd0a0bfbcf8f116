#include <gtest/gtest.h>
#include "gzsplit/core/Splitter.hpp"
#include "TestHelpers.hpp"

using namespace GzSplit;
using namespace GzSplitTest;

class SplitterTest : public ::testing::Test {
protected:
    std::unique_ptr<Splitter> makeSplitter(uint64_t chunkSize, uint64_t maxSegmentSize) {
        SplitterConfig config;
        config.chunkSize = chunkSize;
        config.maxSegmentSize = maxSegmentSize;
        return std::make_unique<Splitter>(config, "tbl_0011aabb_input.csv", strategy, store);
    }

    void feed(Splitter& splitter, const std::string& data, const std::vector<size_t>& sizes) {
        size_t off = 0;
        for (size_t size : sizes) {
            splitter.submit(DataChunk{toBytes(data.substr(off, size))});
            off += size;
        }
        splitter.submit(EndOfStream{});
    }

    std::string concatenatedSegments(const Splitter& splitter) {
        auto objects = store->objects();
        std::string restored;
        for (const auto& name : splitter.producedObjects()) {
            restored += gunzip(objects.at(name));
        }
        return restored;
    }

    std::shared_ptr<GzipStrategy> strategy = std::make_shared<GzipStrategy>(1);
    std::shared_ptr<MemoryObjectStore> store = std::make_shared<MemoryObjectStore>();
};

TEST_F(SplitterTest, EmptySourceProducesNoSegments) {
    auto splitter = makeSplitter(4, 16);
    EXPECT_EQ(splitter->state(), SplitterState::Idle);
    splitter->submit(EndOfStream{});

    EXPECT_EQ(splitter->state(), SplitterState::Done);
    EXPECT_TRUE(splitter->completion().isSignaled());
    splitter->completion().wait();
    EXPECT_TRUE(splitter->producedObjects().empty());
    EXPECT_EQ(store->openedCount(), 0);
}

TEST_F(SplitterTest, ExactlyMaxSegmentSizeIsOneSegment) {
    auto splitter = makeSplitter(4, 16);
    std::string data = makePayload(16);
    feed(*splitter, data, {4, 4, 4, 4});

    ASSERT_EQ(splitter->segments().size(), 1u);
    EXPECT_EQ(splitter->segments()[0].originalSize, 16u);
    EXPECT_EQ(concatenatedSegments(*splitter), data);
}

TEST_F(SplitterTest, OneByteOverMaxStartsSecondSegment) {
    auto splitter = makeSplitter(4, 16);
    std::string data = makePayload(17);
    feed(*splitter, data, {4, 4, 4, 4, 1});

    ASSERT_EQ(splitter->segments().size(), 2u);
    EXPECT_EQ(splitter->segments()[0].originalSize, 16u);
    EXPECT_EQ(splitter->segments()[1].originalSize, 1u);
    EXPECT_EQ(concatenatedSegments(*splitter), data);
}

TEST_F(SplitterTest, SegmentNamesAreContiguousAndInOrder) {
    auto splitter = makeSplitter(4, 8);
    std::string data = makePayload(37);
    feed(*splitter, data, {4, 4, 4, 4, 4, 4, 4, 4, 4, 1});

    const auto& objects = splitter->producedObjects();
    ASSERT_EQ(objects.size(), 5u);
    for (size_t i = 0; i < objects.size(); ++i) {
        EXPECT_EQ(objects[i], splitter->segmentName(i));
        EXPECT_EQ(splitter->segments()[i].index, i);
    }
    EXPECT_EQ(objects[0], "tbl_0011aabb_input.csv_chunk000000000.gz");
    EXPECT_EQ(objects[4], "tbl_0011aabb_input.csv_chunk000000004.gz");
    EXPECT_EQ(store->commitOrder(), objects);
}

TEST_F(SplitterTest, NextSegmentOpensOnlyAfterPreviousIsCommitted) {
    auto splitter = makeSplitter(4, 8);
    feed(*splitter, makePayload(40), std::vector<size_t>(10, 4));

    auto committedAtOpen = store->committedAtOpen();
    ASSERT_EQ(committedAtOpen.size(), 5u);
    for (size_t i = 0; i < committedAtOpen.size(); ++i) {
        EXPECT_EQ(committedAtOpen[i], i);
    }
}

TEST_F(SplitterTest, UnevenChunksRespectBoundAndRoundTrip) {
    const uint64_t chunkSize = 7;
    const uint64_t maxSegment = 20;
    auto splitter = makeSplitter(chunkSize, maxSegment);
    std::vector<size_t> sizes = {7, 3, 7, 1, 7, 7, 2, 7, 5, 7, 7, 6, 1, 7};
    size_t total = 0;
    for (size_t s : sizes) total += s;
    std::string data = makePayload(total);
    feed(*splitter, data, sizes);

    uint64_t sum = 0;
    for (const auto& segment : splitter->segments()) {
        EXPECT_LE(segment.originalSize, maxSegment + chunkSize);
        sum += segment.originalSize;
    }
    EXPECT_EQ(sum, total);
    EXPECT_EQ(concatenatedSegments(*splitter), data);
}

TEST_F(SplitterTest, OversizedChunkIsAdmittedWhole) {
    auto splitter = makeSplitter(10, 4);
    std::string data = makePayload(13);
    feed(*splitter, data, {10, 3});

    ASSERT_EQ(splitter->segments().size(), 2u);
    EXPECT_EQ(splitter->segments()[0].originalSize, 10u);
    EXPECT_EQ(splitter->segments()[1].originalSize, 3u);
    EXPECT_EQ(concatenatedSegments(*splitter), data);
}

TEST_F(SplitterTest, EmptyDataChunkIsNotEndOfStream) {
    auto splitter = makeSplitter(4, 16);
    splitter->submit(DataChunk{});
    EXPECT_EQ(splitter->state(), SplitterState::Idle);
    EXPECT_FALSE(splitter->completion().isSignaled());

    splitter->submit(DataChunk{toBytes("abcd")});
    EXPECT_EQ(splitter->state(), SplitterState::SegmentOpen);
    splitter->submit(DataChunk{});
    splitter->submit(EndOfStream{});
    ASSERT_EQ(splitter->segments().size(), 1u);
    EXPECT_EQ(concatenatedSegments(*splitter), "abcd");
}

TEST_F(SplitterTest, SubmitAfterDoneIsAProgrammingError) {
    auto splitter = makeSplitter(4, 16);
    splitter->submit(EndOfStream{});
    EXPECT_THROW(splitter->submit(EndOfStream{}), std::logic_error);
    EXPECT_THROW(splitter->submit(DataChunk{toBytes("x")}), std::logic_error);
}

TEST_F(SplitterTest, UploadFailureIsFatalAndReachesWaiter) {
    store->failWritesAfter(5);
    auto splitter = makeSplitter(64, 1024);

    bool threw = false;
    try {
        feed(*splitter, makePayload(256), {64, 64, 64, 64});
    } catch (const UploadError&) {
        threw = true;
        splitter->abort(std::current_exception());
    }
    ASSERT_TRUE(threw);
    EXPECT_EQ(splitter->state(), SplitterState::Done);
    EXPECT_THROW(splitter->completion().wait(), UploadError);
    EXPECT_TRUE(store->objects().empty());
}

TEST_F(SplitterTest, InvalidConfigurationRejected) {
    EXPECT_THROW(makeSplitter(0, 16), std::invalid_argument);
    EXPECT_THROW(makeSplitter(4, 0), std::invalid_argument);
}
