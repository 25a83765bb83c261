#ifndef RELAYPOOL_POOL_POOL_CONFIG_H
#define RELAYPOOL_POOL_POOL_CONFIG_H

#include "connection/relay_config.h"
#include "pool/pool_types.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace relaypool {

/**
 * @brief Relay pool configuration
 */
struct PoolConfig {
    /** Upper bound on simultaneously connected (or connecting) relays */
    uint32_t max_connections = 10;

    /** Scheduling of connectAll() / reconnectFailed() attempts */
    ConnectionStrategy connection_strategy = ConnectionStrategy::PARALLEL;

    /** Strategy used by selectRelay() */
    LoadBalancingStrategy load_balancing = LoadBalancingStrategy::ROUND_ROBIN;

    /** Applied to every relay without an entry in relay_configs */
    RelayConfig default_relay_config;

    /** Per-relay overrides, keyed by URL */
    std::map<std::string, RelayConfig> relay_configs;

    /** Connect threads started up front; more start when all are busy */
    uint32_t connect_workers = 4;

    PoolConfig() = default;

    /**
     * @brief Effective configuration for url
     */
    RelayConfig relayConfigFor(const std::string& url) const;

    /**
     * @brief Reject unusable values
     * @throws ConfigurationException
     */
    void validate() const;
};

/**
 * @brief Fluent builder for PoolConfig
 *
 * Example Usage:
 * @code
 * PoolConfig config = PoolConfigBuilder()
 *     .withMaxConnections(3)
 *     .withConnectionStrategy(ConnectionStrategy::PRIORITY)
 *     .withRelayPriority("wss://a.example", 1)
 *     .build();
 * @endcode
 */
class PoolConfigBuilder {
public:
    PoolConfigBuilder() = default;

    PoolConfigBuilder& withMaxConnections(uint32_t max);
    PoolConfigBuilder& withConnectionStrategy(ConnectionStrategy strategy);
    PoolConfigBuilder& withLoadBalancing(LoadBalancingStrategy strategy);
    PoolConfigBuilder& withConnectWorkers(uint32_t workers);
    PoolConfigBuilder& withDefaultTimeout(std::chrono::milliseconds timeout);
    PoolConfigBuilder& withDefaultRelayConfig(const RelayConfig& config);
    PoolConfigBuilder& withRelayConfig(const std::string& url, const RelayConfig& config);

    /**
     * @brief Override only the priority of url (other fields from the default)
     */
    PoolConfigBuilder& withRelayPriority(const std::string& url, int32_t priority);

    /**
     * @brief Validate and return the configuration
     * @throws ConfigurationException
     */
    PoolConfig build() const;

private:
    PoolConfig config_;
};

} // namespace relaypool

#endif // RELAYPOOL_POOL_POOL_CONFIG_H
