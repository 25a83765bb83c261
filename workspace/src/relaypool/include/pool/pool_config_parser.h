#ifndef RELAYPOOL_POOL_POOL_CONFIG_PARSER_H
#define RELAYPOOL_POOL_POOL_CONFIG_PARSER_H

#include "pool/pool_config.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace relaypool {

/**
 * @brief Relay list plus pool configuration, ready to build a RelayPool
 */
struct PoolDefinition {
    std::vector<std::string> relay_urls;
    PoolConfig config;
};

/**
 * @brief Pool definition parser
 *
 * Parses and validates pool definition JSON documents.
 *
 * Schema:
 * @code
 * {
 *   "relays": [
 *     "wss://relay-a.example",
 *     { "url": "wss://relay-b.example", "priority": 1, "timeout-ms": 5000,
 *       "headers": { "User-Agent": "relaypool" } }
 *   ],
 *   "max-connections": 10,
 *   "connection-strategy": "parallel",       // or "priority"
 *   "load-balancing": "round-robin",         // "least-connections", "lowest-latency"
 *   "connect-workers": 4,
 *   "default-timeout-ms": 10000
 * }
 * @endcode
 *
 * Only "relays" is required. Every failure raises ConfigurationException.
 */
class PoolConfigParser {
public:
    /**
     * @brief Parse a definition file
     * @throws ConfigurationException if the file cannot be read or is invalid
     */
    static PoolDefinition parseFile(const std::string& path);

    /**
     * @brief Parse a definition from JSON text
     * @throws ConfigurationException if the JSON is malformed or invalid
     */
    static PoolDefinition parseString(const std::string& jsonString);

    /**
     * @brief Parse an already decoded document
     * @throws ConfigurationException if a field is missing or has the wrong type
     */
    static PoolDefinition parse(const nlohmann::json& json);

    static ConnectionStrategy parseConnectionStrategy(const std::string& value);
    static LoadBalancingStrategy parseLoadBalancing(const std::string& value);

private:
    static void parseRelays(const nlohmann::json& json, PoolDefinition& definition);
    static RelayConfig parseRelayObject(const nlohmann::json& json, const RelayConfig& defaults,
                                        std::string& url);

    static uint32_t getUnsigned(const nlohmann::json& json, const std::string& key,
                                uint32_t defaultValue);
    static int32_t getInt(const nlohmann::json& json, const std::string& key,
                          int32_t defaultValue);
    static std::string getString(const nlohmann::json& json, const std::string& key,
                                 const std::string& defaultValue = "");
};

} // namespace relaypool

#endif // RELAYPOOL_POOL_POOL_CONFIG_PARSER_H
