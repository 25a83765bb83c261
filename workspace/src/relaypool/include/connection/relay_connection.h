#ifndef RELAYPOOL_CONNECTION_RELAY_CONNECTION_H
#define RELAYPOOL_CONNECTION_RELAY_CONNECTION_H

#include "connection/connection_state_machine.h"
#include "connection/health_metrics.h"
#include "connection/relay_config.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace relaypool {

/**
 * @brief One relay endpoint: identity, configuration, lifecycle and health
 *
 * The lifecycle hooks (on*) are the contract with the transport layer:
 * the transport, the pool or a test harness calls them in response to
 * socket events and each hook drives the state machine and/or the health
 * metrics. Hooks never throw for an edge that is no longer legal (another
 * thread won the race); they report it through their return value.
 *
 * Hooks on a disposed connection are ignored.
 */
class RelayConnection {
public:
    RelayConnection(std::string url, RelayConfig config);
    ~RelayConnection();

    RelayConnection(const RelayConnection&) = delete;
    RelayConnection& operator=(const RelayConnection&) = delete;

    const std::string& getUrl() const { return url_; }
    const RelayConfig& getConfig() const { return config_; }

    ConnectionState getState() const;
    bool isConnected() const;

    ConnectionStateMachine& getStateMachine() { return stateMachine_; }
    const ConnectionStateMachine& getStateMachine() const { return stateMachine_; }

    HealthMetrics& getHealthMetrics() { return healthMetrics_; }
    const HealthMetrics& getHealthMetrics() const { return healthMetrics_; }

    /**
     * @brief Copy of the current health figures
     */
    HealthSnapshot getHealth() const { return healthMetrics_.snapshot(); }

    // Lifecycle hooks

    /**
     * @brief A connection attempt begins
     *
     * CLOSED is first reset to DISCONNECTED, ERROR moves to RECONNECTING,
     * DISCONNECTED moves to CONNECTING.
     *
     * @return false if the attempt cannot start from the current state
     */
    bool onConnectAttemptStarted(const std::string& reason = "Connection attempt started");

    /**
     * @brief The attempt succeeded
     * @return false if the connection is no longer attempting
     */
    bool onConnectSucceeded();

    /**
     * @brief The attempt failed
     */
    void onConnectFailed(const std::string& reason);

    /**
     * @brief The live connection dropped without being asked to
     * @return true if the connection was connected and is now DISCONNECTED
     */
    bool onUnexpectedDisconnect(const std::string& reason);

    /**
     * @brief A protocol or socket error was observed
     *
     * Always counted; an active or in-progress connection moves to ERROR.
     */
    void onError(const std::string& reason);

    void onLatencyObserved(std::chrono::milliseconds latency);

    /**
     * @brief A message was handed to the relay successfully
     */
    void onMessageDelivered();

    // Load accounting used by the least-connections strategy

    void beginRequest() { activeRequests_++; }
    void endRequest();
    uint32_t getActiveRequestCount() const { return activeRequests_.load(); }

    /**
     * @brief Deliberate teardown (moves to CLOSED unless already there)
     */
    void close(const std::string& reason);

    /**
     * @brief Make the connection inert; state stays readable
     */
    void dispose();

    bool isDisposed() const { return stateMachine_.isDisposed(); }

private:
    const std::string url_;
    const RelayConfig config_;
    ConnectionStateMachine stateMachine_;
    HealthMetrics healthMetrics_;
    std::atomic<uint32_t> activeRequests_{0};

    /** Serializes hooks against dispose(); recursive for hooks fired from state callbacks */
    std::recursive_mutex hookMutex_;
};

using RelayConnectionPtr = std::shared_ptr<RelayConnection>;

} // namespace relaypool

#endif // RELAYPOOL_CONNECTION_RELAY_CONNECTION_H
