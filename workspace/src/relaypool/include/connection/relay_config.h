#ifndef RELAYPOOL_CONNECTION_RELAY_CONFIG_H
#define RELAYPOOL_CONNECTION_RELAY_CONFIG_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace relaypool {

/**
 * @brief Per-relay connection configuration
 *
 * Immutable once attached to a RelayConnection.
 */
struct RelayConfig {
    /** Establishment order under the priority strategy (lower connects first) */
    int32_t priority = 0;

    /** Upper bound for one connection attempt */
    std::chrono::milliseconds timeout{10000};

    /** Extra headers handed to the transport during the handshake */
    std::map<std::string, std::string> headers;
};

} // namespace relaypool

#endif // RELAYPOOL_CONNECTION_RELAY_CONFIG_H
