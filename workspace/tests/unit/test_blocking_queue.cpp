#include <gtest/gtest.h>
#include "utils/blocking_queue.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace relaypool::utils;
using namespace std::chrono_literals;

// ============================================================================
// Basic Operations
// ============================================================================

TEST(BlockingQueueTest, PushAndPopInOrder) {
    BlockingQueue<int> queue;
    for (int i = 0; i < 5; ++i) {
        queue.push(i);
    }
    EXPECT_EQ(queue.size(), 5u);

    for (int i = 0; i < 5; ++i) {
        auto item = queue.pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(item.value(), i);
    }
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BlockingQueueTest, CallableItems) {
    BlockingQueue<std::function<int()>> queue;
    queue.push([]() { return 5; });

    auto task = queue.pop();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ((*task)(), 5);
}

TEST(BlockingQueueTest, TryPopOnEmptyQueue) {
    BlockingQueue<std::string> queue;
    EXPECT_FALSE(queue.tryPop().has_value());

    queue.push("relay");
    auto item = queue.tryPop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "relay");
}

// ============================================================================
// Close
// ============================================================================

TEST(BlockingQueueTest, PushAfterCloseThrows) {
    BlockingQueue<int> queue;
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_THROW(queue.push(1), QueueClosedException);
}

TEST(BlockingQueueTest, ClosedQueueDrainsFirst) {
    BlockingQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BlockingQueueTest, CloseWakesBlockedConsumers) {
    BlockingQueue<int> queue;
    std::atomic<int> woken(0);

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&]() {
            if (!queue.pop().has_value()) {
                ++woken;
            }
        });
    }

    std::this_thread::sleep_for(30ms);
    queue.close();

    for (auto& t : consumers) {
        t.join();
    }
    EXPECT_EQ(woken, 3);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(BlockingQueueTest, ProducersAndConsumers) {
    BlockingQueue<int> queue;
    const int producers = 4;
    const int perProducer = 250;
    std::atomic<long> sum(0);
    std::atomic<int> consumed(0);

    std::vector<std::thread> consumerThreads;
    for (int i = 0; i < 3; ++i) {
        consumerThreads.emplace_back([&]() {
            while (auto item = queue.pop()) {
                sum += *item;
                ++consumed;
            }
        });
    }

    std::vector<std::thread> producerThreads;
    for (int p = 0; p < producers; ++p) {
        producerThreads.emplace_back([&queue]() {
            for (int i = 1; i <= perProducer; ++i) {
                queue.push(i);
            }
        });
    }

    for (auto& t : producerThreads) {
        t.join();
    }
    queue.close();
    for (auto& t : consumerThreads) {
        t.join();
    }

    EXPECT_EQ(consumed, producers * perProducer);
    EXPECT_EQ(sum, static_cast<long>(producers) * perProducer * (perProducer + 1) / 2);
}
