#ifndef RELAYPOOL_CONNECTION_CONNECTION_STATE_MACHINE_H
#define RELAYPOOL_CONNECTION_CONNECTION_STATE_MACHINE_H

#include "connection/connection_state.h"
#include "core/event_stream.h"
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace relaypool {

/**
 * @brief Invalid state transition exception
 *
 * Thrown when a transition is requested along an edge the lifecycle
 * table does not contain. The machine is left untouched.
 */
class InvalidStateTransitionException : public std::runtime_error {
public:
    InvalidStateTransitionException(ConnectionState from, ConnectionState to)
        : std::runtime_error(std::string("Invalid state transition: ") +
                             connectionStateToString(from) + " -> " +
                             connectionStateToString(to))
        , from_(from)
        , to_(to) {}

    ConnectionState from() const { return from_; }
    ConnectionState to() const { return to_; }

private:
    ConnectionState from_;
    ConnectionState to_;
};

/**
 * @brief Lifecycle state machine for a single relay connection
 *
 * Enforces the legal-edge table of ConnectionState, keeps an ordered
 * history seeded with the initial DISCONNECTED entry and publishes every
 * new state on stateStream().
 *
 * Thread-safe. Concurrent transitionTo() calls are serialized: each call is
 * validated against the state left by the previous winner, so contended
 * calls either apply one legal edge or throw without mutating anything.
 * State publication happens inside the same critical section, so
 * subscribers observe transitions in the order they were applied.
 */
class ConnectionStateMachine {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionStateMachine();
    ~ConnectionStateMachine();

    ConnectionStateMachine(const ConnectionStateMachine&) = delete;
    ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

    /**
     * @brief True if the table contains the edge from -> to
     */
    static bool isValidTransition(ConnectionState from, ConnectionState to);

    /**
     * @brief Current state (readable after dispose())
     */
    ConnectionState getCurrentState() const;

    /**
     * @brief Pure predicate: is currentState -> candidate a legal edge?
     */
    bool canTransition(ConnectionState candidate) const;

    /**
     * @brief Move to newState
     * @param newState Target state
     * @param reason Optional human-readable cause, kept as last reason
     * @throws InvalidStateTransitionException on an illegal edge
     * @throws UsageException if the machine has been disposed
     */
    void transitionTo(ConnectionState newState,
                      const std::optional<std::string>& reason = std::nullopt);

    /**
     * @brief Like transitionTo() but reports an illegal edge by returning false
     * @throws UsageException if the machine has been disposed
     */
    bool tryTransitionTo(ConnectionState newState,
                         const std::optional<std::string>& reason = std::nullopt);

    /**
     * @brief States visited, oldest first, starting with DISCONNECTED
     */
    std::vector<ConnectionState> getStateHistory() const;

    /**
     * @brief Full transition records, oldest first
     */
    std::vector<StateTransition> getTransitionHistory() const;

    /**
     * @brief Reason attached to the most recent transition, if any
     */
    std::optional<std::string> getLastTransitionReason() const;

    /**
     * @brief Elapsed time since the last successful transition
     */
    std::chrono::milliseconds getTimeInCurrentState() const;

    /**
     * @brief Unconditionally return to a fresh DISCONNECTED machine
     *
     * Not a validated transition. History shrinks to the initial entry and
     * the last reason is cleared. DISCONNECTED is published if the state
     * actually changed.
     *
     * @throws UsageException if the machine has been disposed
     */
    void reset();

    /**
     * @brief Make the machine inert; further transitions throw UsageException
     */
    void dispose();

    bool isDisposed() const;

    /**
     * @brief Stream of new states, one value per applied transition
     */
    EventStream<ConnectionState>& stateStream() { return stateStream_; }

private:
    bool applyTransition(ConnectionState newState,
                         const std::optional<std::string>& reason,
                         bool throwOnInvalid);

    StateTransition initialEntry() const;

    ConnectionState state_;
    std::vector<StateTransition> history_;
    std::optional<std::string> lastReason_;
    Clock::time_point lastTransitionTime_;
    bool disposed_;

    mutable std::mutex mutex_;              ///< Guards the fields above
    std::recursive_mutex transitionMutex_;  ///< Serializes apply + publish
    EventStream<ConnectionState> stateStream_;
};

} // namespace relaypool

#endif // RELAYPOOL_CONNECTION_CONNECTION_STATE_MACHINE_H
