/**
 * @file test_event_stream.cpp
 * @brief Unit tests for the EventStream multicast channel
 *
 * Tests include:
 * - Fan-out to every subscriber in publish order
 * - No replay for late subscribers
 * - Subscription handle lifetime and unsubscribe
 * - Re-entrant publish/unsubscribe from callbacks
 * - Throwing subscribers do not block delivery
 */

#include "core/event_stream.h"
#include "utils/log.h"
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace relaypool;

class EventStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::setLogSink([](utils::LogLevel, const std::string&) {});
    }

    void TearDown() override {
        utils::setLogSink(nullptr);
    }
};

// ============================================================================
// Delivery
// ============================================================================

TEST_F(EventStreamTest, PublishWithoutSubscribers) {
    EventStream<int> stream;
    EXPECT_NO_THROW(stream.publish(1));
    EXPECT_EQ(stream.subscriberCount(), 0u);
}

TEST_F(EventStreamTest, FanOutToAllSubscribers) {
    EventStream<int> stream;
    std::vector<int> first;
    std::vector<int> second;

    auto subA = stream.subscribe([&](const int& v) { first.push_back(v); });
    auto subB = stream.subscribe([&](const int& v) { second.push_back(v); });

    stream.publish(1);
    stream.publish(2);
    stream.publish(3);

    EXPECT_EQ(first, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(second, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(stream.subscriberCount(), 2u);
}

TEST_F(EventStreamTest, LateSubscriberSeesNoReplay) {
    EventStream<std::string> stream;
    stream.publish("early");

    std::vector<std::string> seen;
    auto sub = stream.subscribe([&](const std::string& v) { seen.push_back(v); });
    stream.publish("late");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "late");
}

TEST_F(EventStreamTest, SubscribersCalledInRegistrationOrder) {
    EventStream<int> stream;
    std::vector<std::string> calls;

    auto subA = stream.subscribe([&](const int&) { calls.push_back("a"); });
    auto subB = stream.subscribe([&](const int&) { calls.push_back("b"); });
    auto subC = stream.subscribe([&](const int&) { calls.push_back("c"); });

    stream.publish(0);
    EXPECT_EQ(calls, (std::vector<std::string>{"a", "b", "c"}));
}

// ============================================================================
// Subscription lifetime
// ============================================================================

TEST_F(EventStreamTest, UnsubscribeStopsDelivery) {
    EventStream<int> stream;
    int count = 0;

    auto sub = stream.subscribe([&](const int&) { count++; });
    EXPECT_TRUE(sub.isActive());

    stream.publish(1);
    sub.unsubscribe();
    EXPECT_FALSE(sub.isActive());
    stream.publish(2);

    EXPECT_EQ(count, 1);
    EXPECT_EQ(stream.subscriberCount(), 0u);

    // Idempotent
    EXPECT_NO_THROW(sub.unsubscribe());
}

TEST_F(EventStreamTest, DestroyingHandleUnsubscribes) {
    EventStream<int> stream;
    int count = 0;

    {
        auto sub = stream.subscribe([&](const int&) { count++; });
        stream.publish(1);
    }
    stream.publish(2);

    EXPECT_EQ(count, 1);
    EXPECT_EQ(stream.subscriberCount(), 0u);
}

TEST_F(EventStreamTest, MovedHandleKeepsSubscription) {
    EventStream<int> stream;
    int count = 0;

    EventStream<int>::Subscription outer;
    {
        auto inner = stream.subscribe([&](const int&) { count++; });
        outer = std::move(inner);
        EXPECT_FALSE(inner.isActive());
    }

    stream.publish(1);
    EXPECT_EQ(count, 1);
    EXPECT_TRUE(outer.isActive());
}

TEST_F(EventStreamTest, HandleOutlivesStream) {
    EventStream<int>::Subscription sub;
    {
        EventStream<int> stream;
        sub = stream.subscribe([](const int&) {});
    }
    EXPECT_FALSE(sub.isActive());
    EXPECT_NO_THROW(sub.unsubscribe());
}

TEST_F(EventStreamTest, ClearDropsEverySubscriber) {
    EventStream<int> stream;
    int count = 0;
    auto subA = stream.subscribe([&](const int&) { count++; });
    auto subB = stream.subscribe([&](const int&) { count++; });

    stream.clear();
    stream.publish(1);

    EXPECT_EQ(count, 0);
    EXPECT_EQ(stream.subscriberCount(), 0u);
}

// ============================================================================
// Re-entrancy and failures
// ============================================================================

TEST_F(EventStreamTest, UnsubscribeFromInsideCallback) {
    EventStream<int> stream;
    int count = 0;
    EventStream<int>::Subscription sub;

    sub = stream.subscribe([&](const int&) {
        count++;
        sub.unsubscribe();
    });

    stream.publish(1);
    stream.publish(2);
    EXPECT_EQ(count, 1);
}

TEST_F(EventStreamTest, PublishFromInsideCallback) {
    EventStream<int> stream;
    std::vector<int> seen;

    auto sub = stream.subscribe([&](const int& v) {
        seen.push_back(v);
        if (v == 1) {
            stream.publish(2);
        }
    });

    stream.publish(1);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST_F(EventStreamTest, ThrowingSubscriberDoesNotBlockOthers) {
    EventStream<int> stream;
    int delivered = 0;

    auto subA = stream.subscribe([](const int&) { throw std::runtime_error("boom"); });
    auto subB = stream.subscribe([&](const int&) { delivered++; });

    EXPECT_NO_THROW(stream.publish(1));
    EXPECT_EQ(delivered, 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(EventStreamTest, ConcurrentPublishersDeliverEveryValue) {
    EventStream<int> stream;
    std::atomic<int> total(0);
    auto sub = stream.subscribe([&](const int& v) { total += v; });

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([&stream]() {
            for (int i = 0; i < 250; ++i) {
                stream.publish(1);
            }
        });
    }
    for (auto& t : publishers) {
        t.join();
    }

    EXPECT_EQ(total.load(), 1000);
}
