// blocking-queue-test.cpp - Blocking Resource Queue Tests

// stl includes
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

// lib includes
#include <gtest/gtest.h>
#include <whisperserve/blocking-queue.hpp>

using namespace whisperserve;


TEST(BlockingQueueTest, HandsOutItemsInReleaseOrder) {
    BlockingQueue<std::string> queue;
    queue.release("first");
    queue.release("second");

    EXPECT_EQ(queue.acquire(), "first");
    EXPECT_EQ(queue.acquire(), "second");
}

TEST(BlockingQueueTest, AcquireBlocksUntilRelease) {
    BlockingQueue<int> queue;
    std::atomic<int> taken(-1);

    std::thread waiter([&]() { taken = queue.acquire(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(taken.load(), -1);

    queue.release(7);
    waiter.join();
    EXPECT_EQ(taken.load(), 7);
}

TEST(BlockingQueueTest, DrainTakesEverythingWithoutWaiting) {
    BlockingQueue<int> queue;
    EXPECT_TRUE(queue.drain().empty());

    queue.release(1);
    queue.release(2);

    EXPECT_EQ(queue.drain(), std::vector<int>({1, 2}));
    EXPECT_TRUE(queue.drain().empty());
}
