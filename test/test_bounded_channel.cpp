#include <gtest/gtest.h>
#include "gzsplit/core/BoundedChannel.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace GzSplit;

TEST(BoundedChannelTest, DeliversInOrderAndEndsAfterClose) {
    BoundedChannel<int> channel(1);
    std::vector<int> received;
    std::thread consumer([&] {
        int value;
        while (channel.pop(value)) {
            received.push_back(value);
        }
    });
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(channel.push(i));
    }
    channel.close();
    consumer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(BoundedChannelTest, PushBlocksWhileFull) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(1));

    std::atomic<bool> secondPushDone{false};
    std::thread producer([&] {
        channel.push(2);
        secondPushDone = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(secondPushDone.load());
    EXPECT_EQ(channel.size(), 1u);

    int value = 0;
    ASSERT_TRUE(channel.pop(value));
    EXPECT_EQ(value, 1);
    producer.join();
    EXPECT_TRUE(secondPushDone.load());
    ASSERT_TRUE(channel.pop(value));
    EXPECT_EQ(value, 2);
}

TEST(BoundedChannelTest, AbortReleasesBlockedProducer) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(1));

    std::atomic<int> result{-1};
    std::thread producer([&] { result = channel.push(2) ? 1 : 0; });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.abort();
    producer.join();

    EXPECT_EQ(result.load(), 0);
    EXPECT_TRUE(channel.aborted());
    int value;
    EXPECT_FALSE(channel.pop(value));
}

TEST(BoundedChannelTest, CloseStillDrainsQueuedItem) {
    BoundedChannel<int> channel(1);
    ASSERT_TRUE(channel.push(42));
    channel.close();

    int value = 0;
    ASSERT_TRUE(channel.pop(value));
    EXPECT_EQ(value, 42);
    EXPECT_FALSE(channel.pop(value));
    EXPECT_FALSE(channel.aborted());
}

TEST(BoundedChannelTest, PushAfterCloseIsAProgrammingError) {
    BoundedChannel<int> channel(1);
    channel.close();
    EXPECT_THROW(channel.push(1), std::logic_error);
}

TEST(BoundedChannelTest, ZeroCapacityRejected) {
    EXPECT_THROW(BoundedChannel<int>(0), std::invalid_argument);
}
