// GoogleTest unit tests for the inbound queue
#include "network/inbound_queue.h"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST(InboundQueueTest, EmptyQueueYieldsNothing)
{
    InboundQueue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(InboundQueueTest, PopsInInsertionOrder)
{
    InboundQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.try_pop(), 1);
    EXPECT_EQ(queue.try_pop(), 2);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_TRUE(queue.empty());
}

TEST(InboundQueueTest, PopForTimesOut)
{
    InboundQueue<int> queue;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop_for(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(InboundQueueTest, PopForWakesOnPush)
{
    InboundQueue<int> queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        queue.push(42);
    });
    EXPECT_EQ(queue.pop_for(5s), 42);
    producer.join();
}

TEST(InboundQueueTest, ConcurrentProducerKeepsOrder)
{
    constexpr int kCount = 10000;
    InboundQueue<int> queue;
    std::thread producer([&] {
        for (int i = 0; i < kCount; ++i) {
            queue.push(i);
        }
    });

    int expected = 0;
    while (expected < kCount) {
        if (auto value = queue.pop_for(1s)) {
            ASSERT_EQ(*value, expected);
            ++expected;
        } else {
            FAIL() << "producer stalled at " << expected;
        }
    }
    producer.join();
    EXPECT_TRUE(queue.empty());
}
