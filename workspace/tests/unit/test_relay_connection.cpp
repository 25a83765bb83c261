/**
 * @file test_relay_connection.cpp
 * @brief Unit tests for RelayConnection lifecycle hooks
 */

#include "connection/relay_connection.h"
#include "utils/log.h"
#include <gtest/gtest.h>

using namespace relaypool;
using namespace std::chrono_literals;

class RelayConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::setLogSink([](utils::LogLevel, const std::string&) {});

        RelayConfig config;
        config.priority = 2;
        config.timeout = 1500ms;
        config.headers["User-Agent"] = "relaypool-test";
        relay = std::make_shared<RelayConnection>("wss://relay.example", config);
    }

    void TearDown() override {
        utils::setLogSink(nullptr);
    }

    RelayConnectionPtr relay;
};

TEST_F(RelayConnectionTest, ExposesIdentityAndConfig) {
    EXPECT_EQ(relay->getUrl(), "wss://relay.example");
    EXPECT_EQ(relay->getConfig().priority, 2);
    EXPECT_EQ(relay->getConfig().timeout, 1500ms);
    EXPECT_EQ(relay->getConfig().headers.at("User-Agent"), "relaypool-test");
    EXPECT_EQ(relay->getState(), ConnectionState::DISCONNECTED);
    EXPECT_FALSE(relay->isConnected());
}

TEST_F(RelayConnectionTest, DefaultConfig) {
    RelayConfig config;
    EXPECT_EQ(config.priority, 0);
    EXPECT_EQ(config.timeout, 10000ms);
    EXPECT_TRUE(config.headers.empty());
}

// ============================================================================
// Hooks
// ============================================================================

TEST_F(RelayConnectionTest, SuccessfulAttempt) {
    EXPECT_TRUE(relay->onConnectAttemptStarted());
    EXPECT_EQ(relay->getState(), ConnectionState::CONNECTING);

    EXPECT_TRUE(relay->onConnectSucceeded());
    EXPECT_TRUE(relay->isConnected());
    EXPECT_EQ(relay->getHealthMetrics().getSuccessCount(), 1u);
    EXPECT_TRUE(relay->getHealth().healthy);
}

TEST_F(RelayConnectionTest, FailedAttemptThenRetryReconnects) {
    relay->onConnectAttemptStarted();
    relay->onConnectFailed("refused");

    EXPECT_EQ(relay->getState(), ConnectionState::ERROR);
    EXPECT_EQ(relay->getHealthMetrics().getErrorCount(), 1u);
    EXPECT_EQ(*relay->getStateMachine().getLastTransitionReason(), "refused");

    EXPECT_TRUE(relay->onConnectAttemptStarted());
    EXPECT_EQ(relay->getState(), ConnectionState::RECONNECTING);
    EXPECT_TRUE(relay->onConnectSucceeded());
    EXPECT_TRUE(relay->isConnected());
}

TEST_F(RelayConnectionTest, AttemptFromClosedReopens) {
    relay->close("done");
    ASSERT_EQ(relay->getState(), ConnectionState::CLOSED);

    EXPECT_TRUE(relay->onConnectAttemptStarted());
    EXPECT_EQ(relay->getState(), ConnectionState::CONNECTING);

    auto history = relay->getStateMachine().getStateHistory();
    std::vector<ConnectionState> expected = {
        ConnectionState::DISCONNECTED,
        ConnectionState::CLOSED,
        ConnectionState::DISCONNECTED,
        ConnectionState::CONNECTING
    };
    EXPECT_EQ(history, expected);
}

TEST_F(RelayConnectionTest, AttemptWhileConnectedIsRefused) {
    relay->onConnectAttemptStarted();
    relay->onConnectSucceeded();

    EXPECT_FALSE(relay->onConnectAttemptStarted());
    EXPECT_TRUE(relay->isConnected());
}

TEST_F(RelayConnectionTest, SuccessWithoutAttemptIsIgnored) {
    EXPECT_FALSE(relay->onConnectSucceeded());
    EXPECT_EQ(relay->getState(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(relay->getHealthMetrics().getSuccessCount(), 0u);
}

TEST_F(RelayConnectionTest, UnexpectedDisconnect) {
    relay->onConnectAttemptStarted();
    relay->onConnectSucceeded();

    EXPECT_TRUE(relay->onUnexpectedDisconnect("socket closed"));
    EXPECT_EQ(relay->getState(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(relay->getHealthMetrics().getErrorCount(), 1u);

    // Only a live connection can be lost
    EXPECT_FALSE(relay->onUnexpectedDisconnect("again"));
    EXPECT_EQ(relay->getHealthMetrics().getErrorCount(), 1u);
}

TEST_F(RelayConnectionTest, ErrorWhileConnected) {
    relay->onConnectAttemptStarted();
    relay->onConnectSucceeded();

    relay->onError("protocol violation");
    EXPECT_EQ(relay->getState(), ConnectionState::ERROR);
    EXPECT_EQ(relay->getHealthMetrics().getErrorCount(), 1u);
}

TEST_F(RelayConnectionTest, ErrorWhileIdleOnlyCounts) {
    relay->onError("stray frame");
    EXPECT_EQ(relay->getState(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(relay->getHealthMetrics().getErrorCount(), 1u);
}

TEST_F(RelayConnectionTest, LatencyAndDeliveryFeedHealth) {
    relay->onLatencyObserved(120ms);
    relay->onMessageDelivered();

    HealthSnapshot health = relay->getHealth();
    EXPECT_EQ(*health.last_latency, 120ms);
    EXPECT_EQ(health.success_count, 1u);
}

// ============================================================================
// Request accounting
// ============================================================================

TEST_F(RelayConnectionTest, ActiveRequestCount) {
    EXPECT_EQ(relay->getActiveRequestCount(), 0u);
    relay->beginRequest();
    relay->beginRequest();
    EXPECT_EQ(relay->getActiveRequestCount(), 2u);
    relay->endRequest();
    EXPECT_EQ(relay->getActiveRequestCount(), 1u);
    relay->endRequest();
    relay->endRequest();
    EXPECT_EQ(relay->getActiveRequestCount(), 0u);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(RelayConnectionTest, CloseIsIdempotent) {
    relay->onConnectAttemptStarted();
    relay->onConnectSucceeded();

    relay->close("bye");
    relay->close("bye again");
    EXPECT_EQ(relay->getState(), ConnectionState::CLOSED);
    EXPECT_EQ(relay->getStateMachine().getStateHistory().size(), 4u);
}

TEST_F(RelayConnectionTest, HooksIgnoredAfterDispose) {
    relay->onConnectAttemptStarted();
    relay->onConnectSucceeded();
    relay->dispose();

    EXPECT_TRUE(relay->isDisposed());
    EXPECT_FALSE(relay->onConnectAttemptStarted());
    EXPECT_FALSE(relay->onUnexpectedDisconnect("late"));
    EXPECT_NO_THROW(relay->onConnectFailed("late"));
    EXPECT_NO_THROW(relay->onError("late"));
    EXPECT_NO_THROW(relay->close("late"));
    EXPECT_EQ(relay->getState(), ConnectionState::CONNECTED);
}
