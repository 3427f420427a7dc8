// bounded_queue_test.cpp: FIFO order, back-pressure and close semantics.

#include <gtest/gtest.h>

#include "bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST(BoundedQueueTest, PreservesOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(queue.pop(10ms), 1);
    EXPECT_EQ(queue.pop(10ms), 2);
    EXPECT_EQ(queue.pop(10ms), 3);
    EXPECT_FALSE(queue.pop(10ms).has_value());
}

TEST(BoundedQueueTest, PushBlocksWhileFull) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(queue.pop(100ms), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(BoundedQueueTest, CloseReleasesBlockedProducer) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> result{true};
    std::thread producer([&]() { result = queue.push(2); });

    std::this_thread::sleep_for(20ms);
    queue.close();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_TRUE(queue.closed());
}

TEST(BoundedQueueTest, ClosedQueueDrainsBeforeReportingEmpty) {
    BoundedQueue<int> queue(4);
    queue.push(7);
    queue.push(8);
    queue.close();

    EXPECT_FALSE(queue.push(9));
    EXPECT_EQ(queue.pop(10ms), 7);
    EXPECT_EQ(queue.pop(10ms), 8);
    EXPECT_FALSE(queue.pop(10ms).has_value());
}

TEST(BoundedQueueTest, ZeroCapacityIsClampedToOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}
