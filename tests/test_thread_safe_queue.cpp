#include <gtest/gtest.h>
#include <nfcollect/thread_safe_queue.hpp>
#include <thread>

using namespace nfcollect;
using namespace std::chrono_literals;

TEST(ThreadSafeQueueTest, FifoOrder) {
    ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.push(2);

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueueTest, DropNewestWhenFull) {
    ThreadSafeQueue<int> queue(2, OverflowPolicy::DROP_NEWEST);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_FALSE(queue.push(3));

    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
}

TEST(ThreadSafeQueueTest, DropOldestWhenFull) {
    ThreadSafeQueue<int> queue(2, OverflowPolicy::DROP_OLDEST);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));

    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(ThreadSafeQueueTest, DoneQueueDrainsThenStops) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.set_done();

    EXPECT_TRUE(queue.is_done());
    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.pop(), 7);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_FALSE(queue.try_pop(10ms).has_value());
}

TEST(ThreadSafeQueueTest, TryPopTimesOut) {
    ThreadSafeQueue<int> queue;
    EXPECT_FALSE(queue.try_pop(20ms).has_value());
}

TEST(ThreadSafeQueueTest, ConsumerWakesOnDone) {
    ThreadSafeQueue<int> queue;
    int consumed = 0;

    std::thread consumer([&] {
        while (auto item = queue.pop()) {
            consumed += *item;
        }
    });

    for (int i = 1; i <= 100; ++i) {
        queue.push(i);
    }
    queue.set_done();
    consumer.join();

    EXPECT_EQ(consumed, 5050);
}
