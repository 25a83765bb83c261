/**
 * @file test_load_balancer.cpp
 * @brief Unit tests for LoadBalancer selection strategies
 */

#include "pool/load_balancer.h"
#include "utils/log.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace relaypool;
using namespace std::chrono_literals;

class LoadBalancerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::setLogSink([](utils::LogLevel, const std::string&) {});
        a = std::make_shared<RelayConnection>("wss://a.example", RelayConfig());
        b = std::make_shared<RelayConnection>("wss://b.example", RelayConfig());
        c = std::make_shared<RelayConnection>("wss://c.example", RelayConfig());
        candidates = {a, b, c};
    }

    void TearDown() override {
        utils::setLogSink(nullptr);
    }

    RelayConnectionPtr a;
    RelayConnectionPtr b;
    RelayConnectionPtr c;
    std::vector<RelayConnectionPtr> candidates;
};

TEST_F(LoadBalancerTest, EmptyCandidatesRejected) {
    LoadBalancer balancer;
    EXPECT_THROW(balancer.selectRelay({}), std::invalid_argument);
}

TEST_F(LoadBalancerTest, DefaultStrategyIsRoundRobin) {
    LoadBalancer balancer;
    EXPECT_EQ(balancer.getStrategy(), LoadBalancingStrategy::ROUND_ROBIN);
}

// ============================================================================
// Round robin
// ============================================================================

TEST_F(LoadBalancerTest, RoundRobinTwoFullPasses) {
    LoadBalancer balancer(LoadBalancingStrategy::ROUND_ROBIN);

    std::vector<RelayConnectionPtr> picks;
    for (int i = 0; i < 6; ++i) {
        picks.push_back(balancer.selectRelay(candidates));
    }

    std::vector<RelayConnectionPtr> expected = {a, b, c, a, b, c};
    EXPECT_EQ(picks, expected);
}

TEST_F(LoadBalancerTest, RoundRobinSurvivesShrinkingCandidates) {
    LoadBalancer balancer(LoadBalancingStrategy::ROUND_ROBIN);
    balancer.selectRelay(candidates);
    balancer.selectRelay(candidates);
    balancer.selectRelay(candidates);

    std::vector<RelayConnectionPtr> fewer = {a, c};
    EXPECT_EQ(balancer.selectRelay(fewer), c);
    EXPECT_EQ(balancer.selectRelay(fewer), a);
}

TEST_F(LoadBalancerTest, ResetCursor) {
    LoadBalancer balancer(LoadBalancingStrategy::ROUND_ROBIN);
    balancer.selectRelay(candidates);
    balancer.selectRelay(candidates);
    balancer.resetCursor();
    EXPECT_EQ(balancer.selectRelay(candidates), a);
}

TEST_F(LoadBalancerTest, CandidatesNotModified) {
    LoadBalancer balancer(LoadBalancingStrategy::ROUND_ROBIN);
    auto copy = candidates;
    balancer.selectRelay(candidates);
    EXPECT_EQ(candidates, copy);
}

// ============================================================================
// Least connections
// ============================================================================

TEST_F(LoadBalancerTest, LeastConnectionsPicksIdlest) {
    LoadBalancer balancer(LoadBalancingStrategy::LEAST_CONNECTIONS);
    a->beginRequest();
    a->beginRequest();
    b->beginRequest();
    c->beginRequest();
    c->beginRequest();
    c->beginRequest();

    EXPECT_EQ(balancer.selectRelay(candidates), b);
}

TEST_F(LoadBalancerTest, LeastConnectionsTieBrokenByOrder) {
    LoadBalancer balancer(LoadBalancingStrategy::LEAST_CONNECTIONS);
    a->beginRequest();

    EXPECT_EQ(balancer.selectRelay(candidates), b);
    EXPECT_EQ(balancer.selectRelay(candidates), b);
}

// ============================================================================
// Lowest latency
// ============================================================================

TEST_F(LoadBalancerTest, LowestLatencyPicksFastest) {
    LoadBalancer balancer(LoadBalancingStrategy::LOWEST_LATENCY);
    a->onLatencyObserved(100ms);
    b->onLatencyObserved(50ms);
    c->onLatencyObserved(200ms);

    EXPECT_EQ(balancer.selectRelay(candidates), b);
}

TEST_F(LoadBalancerTest, LowestLatencyIgnoresUnmeasured) {
    LoadBalancer balancer(LoadBalancingStrategy::LOWEST_LATENCY);
    c->onLatencyObserved(300ms);

    EXPECT_EQ(balancer.selectRelay(candidates), c);
}

TEST_F(LoadBalancerTest, LowestLatencyWithoutSamplesPicksFirst) {
    LoadBalancer balancer(LoadBalancingStrategy::LOWEST_LATENCY);
    EXPECT_EQ(balancer.selectRelay(candidates), a);
}

TEST_F(LoadBalancerTest, LowestLatencyTieBrokenByOrder) {
    LoadBalancer balancer(LoadBalancingStrategy::LOWEST_LATENCY);
    a->onLatencyObserved(80ms);
    b->onLatencyObserved(40ms);
    c->onLatencyObserved(40ms);

    EXPECT_EQ(balancer.selectRelay(candidates), b);
}

TEST(PoolTypesTest, StrategyNames) {
    EXPECT_STREQ(loadBalancingStrategyToString(LoadBalancingStrategy::LOWEST_LATENCY), "LOWEST_LATENCY");
    EXPECT_STREQ(connectionStrategyToString(ConnectionStrategy::PRIORITY), "PRIORITY");
    EXPECT_STREQ(poolConnectionStateToString(PoolConnectionState::DEGRADED), "DEGRADED");
    EXPECT_STREQ(poolEventTypeToString(PoolEventType::FAILOVER), "FAILOVER");
}
