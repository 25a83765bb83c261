/**
 * @file pool_types.h
 * @brief Enumerations and event records shared by the relay pool
 */

#ifndef RELAYPOOL_POOL_POOL_TYPES_H
#define RELAYPOOL_POOL_POOL_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>

namespace relaypool {

/**
 * @brief Aggregate pool health bucket
 *
 * Pure function of (connected, registered), see RelayPool::computeOverallState().
 */
enum class PoolConnectionState {
    /** No relay connected */
    DISCONNECTED,

    /** Fewer than half of the registered relays connected */
    DEGRADED,

    /** At least half, but not all, connected */
    PARTIAL,

    /** Every registered relay connected */
    CONNECTED
};

/**
 * @brief How connectAll() schedules connection attempts
 */
enum class ConnectionStrategy {
    /** Attempts run concurrently on the connect workers */
    PARALLEL,

    /** One attempt at a time, ascending RelayConfig::priority */
    PRIORITY
};

/**
 * @brief How selectRelay() picks among the connected relays
 */
enum class LoadBalancingStrategy {
    /** Cycle through candidates in order */
    ROUND_ROBIN,

    /** Fewest in-flight requests */
    LEAST_CONNECTIONS,

    /** Smallest average latency */
    LOWEST_LATENCY
};

/**
 * @brief One delivered message, as published on the message stream
 */
struct RelayMessage {
    std::string relay_url;
    std::string data;
};

/**
 * @brief Unexpected loss of a previously connected relay
 */
struct FailoverEvent {
    std::string failed_relay;

    /** Connected count after the loss */
    size_t remaining_connections = 0;
};

enum class PoolEventType {
    CONNECTING,
    RECONNECTING,
    CONNECTED,
    CONNECTION_FAILED,
    RELAY_ADDED,
    RELAY_REMOVED,
    RELAY_DISCONNECTED,
    FAILOVER,
    MESSAGE_SENT,
    DISPOSED
};

/**
 * @brief Tagged trace record, superset of the typed streams
 */
struct PoolEvent {
    PoolEventType type;

    /** Relay concerned, empty for pool-wide events */
    std::string relay_url;

    /** Free-form detail (failure reason, recipient count, ...) */
    std::string detail;

    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief Pool counters
 */
struct PoolStats {
    size_t registered_relays = 0;
    size_t connected_relays = 0;
    size_t failed_relays = 0;
    size_t pending_relays = 0;

    uint64_t messages_sent = 0;
    uint64_t send_failures = 0;
    uint64_t connect_attempts = 0;
    uint64_t connect_failures = 0;
    uint64_t failovers = 0;
};

const char* poolConnectionStateToString(PoolConnectionState state);
const char* connectionStrategyToString(ConnectionStrategy strategy);
const char* loadBalancingStrategyToString(LoadBalancingStrategy strategy);
const char* poolEventTypeToString(PoolEventType type);

} // namespace relaypool

#endif // RELAYPOOL_POOL_POOL_TYPES_H
