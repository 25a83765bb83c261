#ifndef RELAYPOOL_CONNECTION_CONNECTION_STATE_H
#define RELAYPOOL_CONNECTION_CONNECTION_STATE_H

#include <chrono>
#include <optional>
#include <string>

namespace relaypool {

/**
 * @brief Lifecycle state of one relay connection
 *
 * State Transitions:
 * - DISCONNECTED → CONNECTING | CLOSED
 * - CONNECTING   → CONNECTED | ERROR | DISCONNECTED | CLOSED
 * - CONNECTED    → DISCONNECTED | ERROR | CLOSED
 * - ERROR        → RECONNECTING | DISCONNECTED | CONNECTING | CLOSED
 * - RECONNECTING → CONNECTED | ERROR | DISCONNECTED | CLOSED
 * - CLOSED       → DISCONNECTED (reuse only)
 */
enum class ConnectionState {
    /**
     * @brief No socket; initial state
     */
    DISCONNECTED,

    /**
     * @brief First connection attempt in progress
     */
    CONNECTING,

    /**
     * @brief Connection established, relay usable for routing
     */
    CONNECTED,

    /**
     * @brief Repeat attempt after an error
     */
    RECONNECTING,

    /**
     * @brief Last attempt or the live connection failed
     */
    ERROR,

    /**
     * @brief Torn down on purpose; terminal except for reuse
     */
    CLOSED
};

/**
 * @brief Convert ConnectionState to string representation
 */
inline const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        case ConnectionState::ERROR:        return "ERROR";
        case ConnectionState::CLOSED:       return "CLOSED";
        default:                            return "UNKNOWN";
    }
}

/**
 * @brief One entry of a state machine's history
 */
struct StateTransition {
    ConnectionState from = ConnectionState::DISCONNECTED;
    ConnectionState to = ConnectionState::DISCONNECTED;
    std::optional<std::string> reason;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace relaypool

#endif // RELAYPOOL_CONNECTION_CONNECTION_STATE_H
