/**
 * @file test_loopback_transport.cpp
 * @brief Unit tests for the in-process LoopbackTransport
 */

#include "transport/loopback_transport.h"
#include "connection/relay_connection.h"
#include "utils/log.h"
#include <gtest/gtest.h>

using namespace relaypool;
using namespace std::chrono_literals;

class LoopbackTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::setLogSink([](utils::LogLevel, const std::string&) {});
        relay = std::make_shared<RelayConnection>("wss://loop.example", RelayConfig());
    }

    void TearDown() override {
        utils::setLogSink(nullptr);
    }

    void establish() {
        relay->onConnectAttemptStarted();
        ASSERT_TRUE(transport.connect(*relay).success());
        relay->onConnectSucceeded();
    }

    LoopbackTransport transport;
    RelayConnectionPtr relay;
};

TEST_F(LoopbackTransportTest, ConnectOpensChannel) {
    auto result = transport.connect(*relay);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.value);
    EXPECT_TRUE(transport.isOpen("wss://loop.example"));
    EXPECT_EQ(transport.getConnectCount(), 1u);
}

TEST_F(LoopbackTransportTest, ConnectFailure) {
    transport.setConnectFailure("wss://loop.example", true);

    auto result = transport.connect(*relay);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, TransportError::CONNECTION_FAILED);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_FALSE(transport.isOpen("wss://loop.example"));
}

TEST_F(LoopbackTransportTest, SendRequiresOpenChannel) {
    auto result = transport.send(*relay, "hello");
    EXPECT_EQ(result.error, TransportError::NOT_CONNECTED);
    EXPECT_TRUE(transport.getSentMessages().empty());
}

TEST_F(LoopbackTransportTest, SendRecordsMessage) {
    establish();

    EXPECT_TRUE(transport.send(*relay, "[\"EVENT\",{}]").success());
    auto sent = transport.getSentMessages("wss://loop.example");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data, "[\"EVENT\",{}]");

    transport.clearSentMessages();
    EXPECT_TRUE(transport.getSentMessages().empty());
}

TEST_F(LoopbackTransportTest, SendFailure) {
    establish();
    transport.setSendFailure("wss://loop.example", true);

    auto result = transport.send(*relay, "hello");
    EXPECT_EQ(result.error, TransportError::SEND_FAILED);
    EXPECT_TRUE(transport.getSentMessages().empty());
}

TEST_F(LoopbackTransportTest, ReportedLatencyFeedsHealth) {
    establish();
    transport.setReportedLatency("wss://loop.example", 75ms);

    transport.send(*relay, "ping");
    EXPECT_EQ(*relay->getHealthMetrics().getLastLatency(), 75ms);
}

TEST_F(LoopbackTransportTest, DisconnectCountsOpenChannelsOnly) {
    transport.disconnect(*relay);
    EXPECT_EQ(transport.getDisconnectCount(), 0u);

    establish();
    transport.disconnect(*relay);
    EXPECT_EQ(transport.getDisconnectCount(), 1u);
    EXPECT_FALSE(transport.isOpen("wss://loop.example"));
}

TEST_F(LoopbackTransportTest, DropConnectionNotifiesRelay) {
    EXPECT_FALSE(transport.dropConnection(*relay));

    establish();
    EXPECT_TRUE(transport.dropConnection(*relay, "peer reset"));
    EXPECT_EQ(relay->getState(), ConnectionState::DISCONNECTED);
    EXPECT_EQ(*relay->getStateMachine().getLastTransitionReason(), "peer reset");
    EXPECT_FALSE(transport.isOpen("wss://loop.example"));
}

TEST_F(LoopbackTransportTest, EstablishConnectionDrivesHooks) {
    relay->onConnectAttemptStarted();
    relay->onConnectFailed("refused");

    EXPECT_TRUE(transport.establishConnection(*relay));
    EXPECT_TRUE(relay->isConnected());
    EXPECT_TRUE(transport.isOpen("wss://loop.example"));
    EXPECT_TRUE(transport.send(*relay, "hello").success());

    EXPECT_FALSE(transport.establishConnection(*relay));
}

TEST(TransportErrorTest, ToString) {
    EXPECT_STREQ(transportErrorToString(TransportError::SUCCESS), "SUCCESS");
    EXPECT_STREQ(transportErrorToString(TransportError::CONNECTION_TIMEOUT), "CONNECTION_TIMEOUT");
    EXPECT_STREQ(transportErrorToString(TransportError::SEND_FAILED), "SEND_FAILED");
}
