#include "connection/connection_state_machine.h"
#include "core/exceptions.h"
#include "utils/log.h"

namespace relaypool {

ConnectionStateMachine::ConnectionStateMachine()
    : state_(ConnectionState::DISCONNECTED)
    , lastTransitionTime_(Clock::now())
    , disposed_(false) {
    history_.push_back(initialEntry());
}

ConnectionStateMachine::~ConnectionStateMachine() {
    stateStream_.clear();
}

bool ConnectionStateMachine::isValidTransition(ConnectionState from, ConnectionState to) {
    switch (from) {
        case ConnectionState::DISCONNECTED:
            return to == ConnectionState::CONNECTING ||
                   to == ConnectionState::CLOSED;

        case ConnectionState::CONNECTING:
            return to == ConnectionState::CONNECTED ||
                   to == ConnectionState::ERROR ||
                   to == ConnectionState::DISCONNECTED ||
                   to == ConnectionState::CLOSED;

        case ConnectionState::CONNECTED:
            return to == ConnectionState::DISCONNECTED ||
                   to == ConnectionState::ERROR ||
                   to == ConnectionState::CLOSED;

        case ConnectionState::ERROR:
            return to == ConnectionState::RECONNECTING ||
                   to == ConnectionState::DISCONNECTED ||
                   to == ConnectionState::CONNECTING ||
                   to == ConnectionState::CLOSED;

        case ConnectionState::RECONNECTING:
            return to == ConnectionState::CONNECTED ||
                   to == ConnectionState::ERROR ||
                   to == ConnectionState::DISCONNECTED ||
                   to == ConnectionState::CLOSED;

        case ConnectionState::CLOSED:
            return to == ConnectionState::DISCONNECTED;
    }

    return false;
}

ConnectionState ConnectionStateMachine::getCurrentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionStateMachine::canTransition(ConnectionState candidate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isValidTransition(state_, candidate);
}

void ConnectionStateMachine::transitionTo(ConnectionState newState,
                                          const std::optional<std::string>& reason) {
    applyTransition(newState, reason, true);
}

bool ConnectionStateMachine::tryTransitionTo(ConnectionState newState,
                                             const std::optional<std::string>& reason) {
    return applyTransition(newState, reason, false);
}

bool ConnectionStateMachine::applyTransition(ConnectionState newState,
                                             const std::optional<std::string>& reason,
                                             bool throwOnInvalid) {
    std::lock_guard<std::recursive_mutex> transition(transitionMutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (disposed_) {
            throw UsageException(std::string("State machine is disposed; cannot transition to ") +
                                 connectionStateToString(newState));
        }

        if (!isValidTransition(state_, newState)) {
            if (throwOnInvalid) {
                throw InvalidStateTransitionException(state_, newState);
            }
            LOGV_FMT("ConnectionStateMachine: rejected " << connectionStateToString(state_)
                     << " -> " << connectionStateToString(newState));
            return false;
        }

        StateTransition record;
        record.from = state_;
        record.to = newState;
        record.reason = reason;
        record.timestamp = std::chrono::system_clock::now();

        history_.push_back(std::move(record));
        state_ = newState;
        lastReason_ = reason;
        lastTransitionTime_ = Clock::now();
    }

    stateStream_.publish(newState);
    return true;
}

std::vector<ConnectionState> ConnectionStateMachine::getStateHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ConnectionState> states;
    states.reserve(history_.size());
    for (const auto& entry : history_) {
        states.push_back(entry.to);
    }
    return states;
}

std::vector<StateTransition> ConnectionStateMachine::getTransitionHistory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::optional<std::string> ConnectionStateMachine::getLastTransitionReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastReason_;
}

std::chrono::milliseconds ConnectionStateMachine::getTimeInCurrentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - lastTransitionTime_);
}

void ConnectionStateMachine::reset() {
    std::lock_guard<std::recursive_mutex> transition(transitionMutex_);

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            throw UsageException("State machine is disposed; cannot reset");
        }

        changed = state_ != ConnectionState::DISCONNECTED;
        state_ = ConnectionState::DISCONNECTED;
        history_.clear();
        history_.push_back(initialEntry());
        lastReason_.reset();
        lastTransitionTime_ = Clock::now();
    }

    if (changed) {
        stateStream_.publish(ConnectionState::DISCONNECTED);
    }
}

void ConnectionStateMachine::dispose() {
    std::lock_guard<std::recursive_mutex> transition(transitionMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
    }
    stateStream_.clear();
}

bool ConnectionStateMachine::isDisposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

StateTransition ConnectionStateMachine::initialEntry() const {
    StateTransition entry;
    entry.from = ConnectionState::DISCONNECTED;
    entry.to = ConnectionState::DISCONNECTED;
    entry.timestamp = std::chrono::system_clock::now();
    return entry;
}

} // namespace relaypool
