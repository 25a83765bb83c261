#include "pool/pool_config.h"
#include "core/exceptions.h"

namespace relaypool {

RelayConfig PoolConfig::relayConfigFor(const std::string& url) const {
    auto it = relay_configs.find(url);
    if (it != relay_configs.end()) {
        return it->second;
    }
    return default_relay_config;
}

void PoolConfig::validate() const {
    if (max_connections == 0) {
        throw ConfigurationException("max_connections must be greater than 0");
    }
    if (connect_workers == 0) {
        throw ConfigurationException("connect_workers must be greater than 0");
    }
    if (default_relay_config.timeout.count() <= 0) {
        throw ConfigurationException("default relay timeout must be positive");
    }
    for (const auto& entry : relay_configs) {
        if (entry.first.empty()) {
            throw ConfigurationException("relay config with empty URL");
        }
        if (entry.second.timeout.count() <= 0) {
            throw ConfigurationException("timeout for " + entry.first + " must be positive");
        }
    }
}

PoolConfigBuilder& PoolConfigBuilder::withMaxConnections(uint32_t max) {
    config_.max_connections = max;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withConnectionStrategy(ConnectionStrategy strategy) {
    config_.connection_strategy = strategy;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withLoadBalancing(LoadBalancingStrategy strategy) {
    config_.load_balancing = strategy;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withConnectWorkers(uint32_t workers) {
    config_.connect_workers = workers;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withDefaultTimeout(std::chrono::milliseconds timeout) {
    config_.default_relay_config.timeout = timeout;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withDefaultRelayConfig(const RelayConfig& config) {
    config_.default_relay_config = config;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withRelayConfig(const std::string& url, const RelayConfig& config) {
    config_.relay_configs[url] = config;
    return *this;
}

PoolConfigBuilder& PoolConfigBuilder::withRelayPriority(const std::string& url, int32_t priority) {
    auto it = config_.relay_configs.find(url);
    if (it == config_.relay_configs.end()) {
        it = config_.relay_configs.emplace(url, config_.default_relay_config).first;
    }
    it->second.priority = priority;
    return *this;
}

PoolConfig PoolConfigBuilder::build() const {
    config_.validate();
    return config_;
}

} // namespace relaypool
