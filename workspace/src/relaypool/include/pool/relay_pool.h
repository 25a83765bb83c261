/**
 * @file relay_pool.h
 * @brief Pool of interchangeable relay connections
 *
 * Owns every registered RelayConnection and partitions them into three
 * views at all times:
 *
 *   connected  established and routable
 *   failed     last attempt failed or the connection was lost (quarantine)
 *   pending    registered but waiting for capacity, or being attempted
 *
 * At most PoolConfig::max_connections relays are connected or being
 * attempted at once. Failed relays do not hold capacity. Nothing is
 * retried automatically: failed relays come back only through
 * reconnectFailed().
 */

#ifndef RELAYPOOL_POOL_RELAY_POOL_H
#define RELAYPOOL_POOL_RELAY_POOL_H

#include "connection/relay_connection.h"
#include "core/event_stream.h"
#include "pool/pool_config.h"
#include "pool/pool_config_parser.h"
#include "pool/pool_types.h"
#include "transport/relay_transport.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relaypool {

/**
 * @brief Relay connection pool
 *
 * Features:
 * - Parallel or priority-ordered connection establishment
 * - Capacity limit with pending queue
 * - Broadcast, targeted send and load-balanced relay selection
 * - Failover notification on unexpected connection loss
 * - Typed event streams plus a tagged trace stream (eventStream())
 *
 * Thread-safe. connectAll(), broadcast(), addRelay(), removeRelay() and
 * reconnectFailed() may be called concurrently; each relay is attempted by
 * at most one caller at a time.
 *
 * Event callbacks run on the thread that caused the event and may call
 * back into the pool. The transport must not call dispose().
 *
 * Example Usage:
 * @code
 * RelayPool pool({"wss://a.example", "wss://b.example"});
 * auto sub = pool.messageStream().subscribe([](const RelayMessage& m) { ... });
 * pool.connectAll();
 * pool.broadcast(payload);
 * pool.dispose();
 * @endcode
 */
class RelayPool {
public:
    /**
     * @brief Register relayUrls (no connection is attempted yet)
     * @param relayUrls Relay URLs; duplicates are registered once
     * @param config Pool configuration
     * @param transport Transport to use; a LoopbackTransport when null
     * @throws ConfigurationException if config is invalid
     */
    explicit RelayPool(const std::vector<std::string>& relayUrls,
                       const PoolConfig& config = PoolConfig(),
                       RelayTransportPtr transport = nullptr);

    /**
     * @brief Build from a parsed definition
     */
    explicit RelayPool(const PoolDefinition& definition, RelayTransportPtr transport = nullptr);

    /**
     * @brief Disposes the pool if the caller has not
     */
    ~RelayPool();

    RelayPool(const RelayPool&) = delete;
    RelayPool& operator=(const RelayPool&) = delete;

    // ==================================================================
    // Connection lifecycle
    // ==================================================================

    /**
     * @brief Attempt every pending and failed relay, within capacity
     *
     * Returns once every attempt it started has resolved. Each attempt is
     * bounded by its relay's configured timeout.
     *
     * @throws UsageException after dispose()
     */
    void connectAll();

    /**
     * @brief Re-attempt every relay in the failed view
     * @throws UsageException after dispose()
     */
    void reconnectFailed();

    /**
     * @brief Register url and attempt it if capacity allows
     * @param url Relay URL
     * @param config Relay configuration; PoolConfig lookup when empty
     * @return false if url is empty or already registered
     * @throws UsageException after dispose()
     */
    bool addRelay(const std::string& url, const std::optional<RelayConfig>& config = std::nullopt);

    /**
     * @brief Disconnect and deregister url, then fill the freed slot
     * @return false if url is not registered
     * @throws UsageException after dispose()
     */
    bool removeRelay(const std::string& url);

    /**
     * @brief Disconnect and release every relay (idempotent)
     *
     * Emits DISPOSED on eventStream() and then detaches all subscribers.
     */
    void dispose();

    bool isDisposed() const;

    // ==================================================================
    // Messaging
    // ==================================================================

    /**
     * @brief Send message to every connected relay
     *
     * One RelayMessage per successful delivery on messageStream(), one
     * MESSAGE_SENT event for the whole call.
     *
     * @return Number of relays that accepted the message
     * @throws UsageException after dispose()
     */
    size_t broadcast(const std::string& message);

    /**
     * @brief Send message to one relay
     * @return false if url is unknown, not connected, or the send failed
     * @throws UsageException after dispose()
     */
    bool sendToRelay(const std::string& url, const std::string& message);

    /**
     * @brief Load-balanced pick among the connected relays
     * @return nullptr when nothing is connected
     * @throws UsageException after dispose()
     */
    RelayConnectionPtr selectRelay();

    // ==================================================================
    // Views
    // ==================================================================

    RelayConnectionPtr getRelay(const std::string& url) const;

    /** Views are ordered by registration */
    std::vector<RelayConnectionPtr> getConnectedRelays() const;
    std::vector<RelayConnectionPtr> getFailedRelays() const;
    std::vector<RelayConnectionPtr> getPendingRelays() const;

    size_t getConnectionCount() const;
    bool isConnected() const;
    size_t getRelayCount() const;
    std::vector<std::string> getRelayUrls() const;

    PoolConnectionState getOverallState() const;
    PoolStats getStats() const;
    const PoolConfig& getConfig() const;

    /**
     * @brief Aggregate state for connected out of total registered relays
     */
    static PoolConnectionState computeOverallState(size_t connected, size_t total);

    // ==================================================================
    // Event streams
    // ==================================================================

    /** URL of every relay that became connected */
    EventStream<std::string>& relayConnectedStream();

    /** URL of every connected relay that was lost or removed */
    EventStream<std::string>& relayDisconnectedStream();

    /** One record per delivered message per relay */
    EventStream<RelayMessage>& messageStream();

    /** Unexpected losses only (not removeRelay) */
    EventStream<FailoverEvent>& failoverStream();

    /** Tagged trace of everything above plus attempts and registrations */
    EventStream<PoolEvent>& eventStream();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace relaypool

#endif // RELAYPOOL_POOL_RELAY_POOL_H
