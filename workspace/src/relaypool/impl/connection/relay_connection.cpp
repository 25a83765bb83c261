#include "connection/relay_connection.h"
#include "utils/log.h"

namespace relaypool {

RelayConnection::RelayConnection(std::string url, RelayConfig config)
    : url_(std::move(url))
    , config_(std::move(config)) {
}

RelayConnection::~RelayConnection() = default;

ConnectionState RelayConnection::getState() const {
    return stateMachine_.getCurrentState();
}

bool RelayConnection::isConnected() const {
    return stateMachine_.getCurrentState() == ConnectionState::CONNECTED;
}

bool RelayConnection::onConnectAttemptStarted(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        LOGD_FMT("RelayConnection::onConnectAttemptStarted: " << url_ << " is disposed");
        return false;
    }

    ConnectionState current = stateMachine_.getCurrentState();
    if (current == ConnectionState::CLOSED) {
        if (!stateMachine_.tryTransitionTo(ConnectionState::DISCONNECTED, std::string("Reopening"))) {
            return false;
        }
        current = ConnectionState::DISCONNECTED;
    }

    ConnectionState target = (current == ConnectionState::ERROR)
        ? ConnectionState::RECONNECTING
        : ConnectionState::CONNECTING;

    bool started = stateMachine_.tryTransitionTo(target, reason);
    if (!started) {
        LOGD_FMT("RelayConnection::onConnectAttemptStarted: " << url_ << " cannot start from "
                 << connectionStateToString(stateMachine_.getCurrentState()));
    }
    return started;
}

bool RelayConnection::onConnectSucceeded() {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        return false;
    }

    if (!stateMachine_.tryTransitionTo(ConnectionState::CONNECTED, std::string("Connection established"))) {
        LOGD_FMT("RelayConnection::onConnectSucceeded: " << url_ << " is "
                 << connectionStateToString(stateMachine_.getCurrentState()) << ", success ignored");
        return false;
    }

    healthMetrics_.recordSuccess();
    return true;
}

void RelayConnection::onConnectFailed(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        return;
    }

    healthMetrics_.recordError();
    stateMachine_.tryTransitionTo(ConnectionState::ERROR, reason);
}

bool RelayConnection::onUnexpectedDisconnect(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        return false;
    }

    if (stateMachine_.getCurrentState() != ConnectionState::CONNECTED) {
        LOGD_FMT("RelayConnection::onUnexpectedDisconnect: " << url_ << " was not connected");
        return false;
    }

    healthMetrics_.recordError();
    return stateMachine_.tryTransitionTo(ConnectionState::DISCONNECTED, reason);
}

void RelayConnection::onError(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        return;
    }

    healthMetrics_.recordError();

    ConnectionState current = stateMachine_.getCurrentState();
    if (current == ConnectionState::CONNECTED ||
        current == ConnectionState::CONNECTING ||
        current == ConnectionState::RECONNECTING) {
        stateMachine_.tryTransitionTo(ConnectionState::ERROR, reason);
    }
}

void RelayConnection::onLatencyObserved(std::chrono::milliseconds latency) {
    healthMetrics_.recordLatency(latency);
}

void RelayConnection::onMessageDelivered() {
    healthMetrics_.recordSuccess();
}

void RelayConnection::endRequest() {
    uint32_t current = activeRequests_.load();
    while (current > 0 && !activeRequests_.compare_exchange_weak(current, current - 1)) {
    }
}

void RelayConnection::close(const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    if (isDisposed()) {
        return;
    }

    if (stateMachine_.getCurrentState() != ConnectionState::CLOSED) {
        stateMachine_.tryTransitionTo(ConnectionState::CLOSED, reason);
    }
}

void RelayConnection::dispose() {
    std::lock_guard<std::recursive_mutex> lock(hookMutex_);
    stateMachine_.dispose();
}

} // namespace relaypool
