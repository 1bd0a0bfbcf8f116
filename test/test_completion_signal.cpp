#include <gtest/gtest.h>
#include "gzsplit/core/CompletionSignal.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace GzSplit;

TEST(CompletionSignalTest, WaitReturnsAfterNotify) {
    CompletionSignal signal;
    EXPECT_FALSE(signal.isSignaled());

    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        signal.notify();
    });
    signal.wait();
    producer.join();

    EXPECT_TRUE(signal.isSignaled());
    // Waiting again does not block
    signal.wait();
}

TEST(CompletionSignalTest, SecondNotifyIsDetected) {
    CompletionSignal signal;
    signal.notify();
    EXPECT_THROW(signal.notify(), std::logic_error);
}

TEST(CompletionSignalTest, FailAfterNotifyIsDetected) {
    CompletionSignal signal;
    signal.notify();
    EXPECT_THROW(signal.fail(std::make_exception_ptr(std::runtime_error("late"))), std::logic_error);
}

TEST(CompletionSignalTest, FailureIsRethrownToWaiter) {
    CompletionSignal signal;
    std::thread producer([&] {
        signal.fail(std::make_exception_ptr(std::runtime_error("upload broke")));
    });
    producer.join();

    try {
        signal.wait();
        FAIL() << "wait() should rethrow";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "upload broke");
    }
}

TEST(CompletionSignalTest, FailRequiresAnException) {
    CompletionSignal signal;
    EXPECT_THROW(signal.fail(nullptr), std::invalid_argument);
    EXPECT_FALSE(signal.isSignaled());
}
