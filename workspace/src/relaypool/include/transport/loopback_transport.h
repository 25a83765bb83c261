#ifndef RELAYPOOL_TRANSPORT_LOOPBACK_TRANSPORT_H
#define RELAYPOOL_TRANSPORT_LOOPBACK_TRANSPORT_H

#include "transport/relay_transport.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace relaypool {

/**
 * @brief In-process transport
 *
 * Every relay connects instantly and accepts every message unless told
 * otherwise. Used as the pool's default transport and by tests to inject
 * failures, slow handshakes and dropped connections.
 */
class LoopbackTransport : public IRelayTransport {
public:
    struct SentMessage {
        std::string relay_url;
        std::string data;
    };

    LoopbackTransport() = default;
    ~LoopbackTransport() override = default;

    TransportResult<bool> connect(RelayConnection& relay) override;
    TransportResult<bool> send(RelayConnection& relay, const std::string& message) override;
    void disconnect(RelayConnection& relay) override;

    // Behaviour injection

    void setConnectFailure(const std::string& url, bool fail);
    void setSendFailure(const std::string& url, bool fail);

    /**
     * @brief Block connect() for url this long before answering
     */
    void setConnectDelay(const std::string& url, std::chrono::milliseconds delay);

    /**
     * @brief Report this round-trip time on every successful send to url
     */
    void setReportedLatency(const std::string& url, std::chrono::milliseconds latency);

    /**
     * @brief Simulate the remote side dropping a live connection
     * @return false if the relay was not open on this transport
     */
    bool dropConnection(RelayConnection& relay, const std::string& reason = "Connection lost");

    /**
     * @brief Simulate the transport (re)connecting a relay on its own
     *
     * Opens the channel and drives the relay's attempt-started and
     * succeeded hooks, as a transport-side reconnect would.
     *
     * @return false if the relay is already connected or refuses the attempt
     */
    bool establishConnection(RelayConnection& relay);

    // Inspection

    bool isOpen(const std::string& url) const;
    std::vector<SentMessage> getSentMessages() const;
    std::vector<SentMessage> getSentMessages(const std::string& url) const;
    uint64_t getConnectCount() const;
    uint64_t getDisconnectCount() const;
    void clearSentMessages();

private:
    mutable std::mutex mutex_;
    std::set<std::string> connectFailures_;
    std::set<std::string> sendFailures_;
    std::map<std::string, std::chrono::milliseconds> connectDelays_;
    std::map<std::string, std::chrono::milliseconds> reportedLatencies_;
    std::set<std::string> open_;
    std::vector<SentMessage> sent_;
    uint64_t connectCount_ = 0;
    uint64_t disconnectCount_ = 0;
};

} // namespace relaypool

#endif // RELAYPOOL_TRANSPORT_LOOPBACK_TRANSPORT_H
