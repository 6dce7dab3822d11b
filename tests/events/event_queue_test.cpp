#include <gtest/gtest.h>
#include "cirrus/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace cirrus::events;

TEST(ThreadSafeQueue, FifoOrder) {
    ThreadSafeQueue<std::string> queue;

    queue.push("first");
    queue.push("second");

    EXPECT_EQ(queue.pop().value(), "first");
    EXPECT_EQ(queue.try_pop().value(), "second");
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 90);
}

TEST(ThreadSafeQueue, ShutdownDrainsThenStops) {
    ThreadSafeQueue<int> queue;

    queue.push(1);
    queue.push(2);
    queue.shutdown();

    EXPECT_FALSE(queue.push(3));
    EXPECT_TRUE(queue.is_shutdown());
    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        auto val = queue.pop();
        EXPECT_FALSE(val.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();

    EXPECT_TRUE(returned);
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += *val;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
    EXPECT_EQ(queue.size(), 0u);
}
