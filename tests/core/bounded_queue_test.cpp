#include "psync/core/bounded_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using psync::BoundedQueue;

TEST(BoundedQueue, PreservesFifoOrder) {
    BoundedQueue<int> queue(4);
    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));
    ASSERT_TRUE(queue.push(3));

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
    EXPECT_TRUE(queue.empty());
}

TEST(BoundedQueue, TryPushRefusesWhenFull) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(BoundedQueue, PushBlocksUntilConsumerMakesRoom) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> second_pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        second_pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_pushed.load());

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(second_pushed.load());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueue, CloseDrainsThenReturnsNullopt) {
    BoundedQueue<int> queue(4);
    queue.push(7);
    queue.close();

    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.pop(), 7);
    EXPECT_EQ(queue.pop(), std::nullopt);
    EXPECT_TRUE(queue.closed());
}

TEST(BoundedQueue, CloseWakesBlockedConsumers) {
    BoundedQueue<int> queue(4);
    std::atomic<int> woken{0};

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&]() {
            if (!queue.pop()) {
                woken++;
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    for (auto& t : consumers) {
        t.join();
    }
    EXPECT_EQ(woken.load(), 3);
}

TEST(BoundedQueue, PopForTimesOut) {
    BoundedQueue<int> queue(1);
    EXPECT_EQ(queue.pop_for(std::chrono::milliseconds(10)), std::nullopt);
}

TEST(BoundedQueue, ZeroCapacityIsTreatedAsOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.try_push(1));
    EXPECT_FALSE(queue.try_push(2));
}
