#include "pool/pool_types.h"

namespace relaypool {

const char* poolConnectionStateToString(PoolConnectionState state) {
    switch (state) {
        case PoolConnectionState::DISCONNECTED: return "DISCONNECTED";
        case PoolConnectionState::DEGRADED: return "DEGRADED";
        case PoolConnectionState::PARTIAL: return "PARTIAL";
        case PoolConnectionState::CONNECTED: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

const char* connectionStrategyToString(ConnectionStrategy strategy) {
    switch (strategy) {
        case ConnectionStrategy::PARALLEL: return "PARALLEL";
        case ConnectionStrategy::PRIORITY: return "PRIORITY";
        default: return "UNKNOWN";
    }
}

const char* loadBalancingStrategyToString(LoadBalancingStrategy strategy) {
    switch (strategy) {
        case LoadBalancingStrategy::ROUND_ROBIN: return "ROUND_ROBIN";
        case LoadBalancingStrategy::LEAST_CONNECTIONS: return "LEAST_CONNECTIONS";
        case LoadBalancingStrategy::LOWEST_LATENCY: return "LOWEST_LATENCY";
        default: return "UNKNOWN";
    }
}

const char* poolEventTypeToString(PoolEventType type) {
    switch (type) {
        case PoolEventType::CONNECTING: return "CONNECTING";
        case PoolEventType::RECONNECTING: return "RECONNECTING";
        case PoolEventType::CONNECTED: return "CONNECTED";
        case PoolEventType::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case PoolEventType::RELAY_ADDED: return "RELAY_ADDED";
        case PoolEventType::RELAY_REMOVED: return "RELAY_REMOVED";
        case PoolEventType::RELAY_DISCONNECTED: return "RELAY_DISCONNECTED";
        case PoolEventType::FAILOVER: return "FAILOVER";
        case PoolEventType::MESSAGE_SENT: return "MESSAGE_SENT";
        case PoolEventType::DISPOSED: return "DISPOSED";
        default: return "UNKNOWN";
    }
}

} // namespace relaypool
