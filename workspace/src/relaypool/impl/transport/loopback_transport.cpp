#include "transport/loopback_transport.h"
#include "connection/relay_connection.h"
#include "utils/log.h"
#include <thread>

namespace relaypool {

TransportResult<bool> LoopbackTransport::connect(RelayConnection& relay) {
    const std::string& url = relay.getUrl();
    std::chrono::milliseconds delay(0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connectCount_++;
        auto it = connectDelays_.find(url);
        if (it != connectDelays_.end()) {
            delay = it->second;
        }
    }

    if (delay.count() > 0) {
        LOGD_FMT("LoopbackTransport: delaying connect to " << url << " by " << delay.count() << "ms");
        std::this_thread::sleep_for(delay);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (connectFailures_.count(url) > 0) {
        return TransportResult<bool>::fail(TransportError::CONNECTION_FAILED,
                                           "Connection refused by " + url);
    }

    open_.insert(url);
    return TransportResult<bool>::ok(true);
}

TransportResult<bool> LoopbackTransport::send(RelayConnection& relay, const std::string& message) {
    const std::string& url = relay.getUrl();
    std::chrono::milliseconds latency(-1);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_.count(url) == 0) {
            return TransportResult<bool>::fail(TransportError::NOT_CONNECTED,
                                               "Not connected to " + url);
        }
        if (sendFailures_.count(url) > 0) {
            return TransportResult<bool>::fail(TransportError::SEND_FAILED,
                                               "Send to " + url + " failed");
        }
        sent_.push_back(SentMessage{url, message});

        auto it = reportedLatencies_.find(url);
        if (it != reportedLatencies_.end()) {
            latency = it->second;
        }
    }

    if (latency.count() >= 0) {
        relay.onLatencyObserved(latency);
    }
    return TransportResult<bool>::ok(true);
}

void LoopbackTransport::disconnect(RelayConnection& relay) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_.erase(relay.getUrl()) > 0) {
        disconnectCount_++;
    }
}

void LoopbackTransport::setConnectFailure(const std::string& url, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
        connectFailures_.insert(url);
    } else {
        connectFailures_.erase(url);
    }
}

void LoopbackTransport::setSendFailure(const std::string& url, bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail) {
        sendFailures_.insert(url);
    } else {
        sendFailures_.erase(url);
    }
}

void LoopbackTransport::setConnectDelay(const std::string& url, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectDelays_[url] = delay;
}

void LoopbackTransport::setReportedLatency(const std::string& url, std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    reportedLatencies_[url] = latency;
}

bool LoopbackTransport::dropConnection(RelayConnection& relay, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_.erase(relay.getUrl()) == 0) {
            return false;
        }
    }

    LOGI_FMT("LoopbackTransport: dropping " << relay.getUrl() << " (" << reason << ")");
    relay.onUnexpectedDisconnect(reason);
    return true;
}

bool LoopbackTransport::establishConnection(RelayConnection& relay) {
    const std::string& url = relay.getUrl();
    if (relay.isConnected()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_.insert(url);
    }

    LOGI_FMT("LoopbackTransport: establishing " << url);
    if (!relay.onConnectAttemptStarted("Reconnected by transport") || !relay.onConnectSucceeded()) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_.erase(url);
        return false;
    }
    return true;
}

bool LoopbackTransport::isOpen(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_.count(url) > 0;
}

std::vector<LoopbackTransport::SentMessage> LoopbackTransport::getSentMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

std::vector<LoopbackTransport::SentMessage> LoopbackTransport::getSentMessages(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SentMessage> result;
    for (const auto& msg : sent_) {
        if (msg.relay_url == url) {
            result.push_back(msg);
        }
    }
    return result;
}

uint64_t LoopbackTransport::getConnectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectCount_;
}

uint64_t LoopbackTransport::getDisconnectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnectCount_;
}

void LoopbackTransport::clearSentMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
}

} // namespace relaypool
