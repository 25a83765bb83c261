#include "pool/pool_config_parser.h"
#include "core/exceptions.h"
#include "utils/log.h"
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace relaypool {

PoolDefinition PoolConfigParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationException("Cannot open pool definition file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    LOGD_FMT("PoolConfigParser: parsing " << path);
    return parseString(buffer.str());
}

PoolDefinition PoolConfigParser::parseString(const std::string& jsonString) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(jsonString);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException(std::string("JSON parse error: ") + e.what());
    }
    return parse(json);
}

PoolDefinition PoolConfigParser::parse(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigurationException("Pool definition must be a JSON object");
    }

    PoolDefinition definition;
    PoolConfig& config = definition.config;

    config.max_connections = getUnsigned(json, "max-connections", config.max_connections);
    config.connect_workers = getUnsigned(json, "connect-workers", config.connect_workers);

    if (json.contains("default-timeout-ms")) {
        config.default_relay_config.timeout =
            std::chrono::milliseconds(getUnsigned(json, "default-timeout-ms", 0));
    }

    if (json.contains("connection-strategy")) {
        config.connection_strategy = parseConnectionStrategy(getString(json, "connection-strategy"));
    }

    if (json.contains("load-balancing")) {
        config.load_balancing = parseLoadBalancing(getString(json, "load-balancing"));
    }

    if (!json.contains("relays")) {
        throw ConfigurationException("Pool definition missing required 'relays' array");
    }
    parseRelays(json["relays"], definition);

    config.validate();
    return definition;
}

ConnectionStrategy PoolConfigParser::parseConnectionStrategy(const std::string& value) {
    if (value == "parallel") {
        return ConnectionStrategy::PARALLEL;
    }
    if (value == "priority") {
        return ConnectionStrategy::PRIORITY;
    }
    throw ConfigurationException("Unknown connection-strategy: '" + value + "'");
}

LoadBalancingStrategy PoolConfigParser::parseLoadBalancing(const std::string& value) {
    if (value == "round-robin") {
        return LoadBalancingStrategy::ROUND_ROBIN;
    }
    if (value == "least-connections") {
        return LoadBalancingStrategy::LEAST_CONNECTIONS;
    }
    if (value == "lowest-latency") {
        return LoadBalancingStrategy::LOWEST_LATENCY;
    }
    throw ConfigurationException("Unknown load-balancing: '" + value + "'");
}

void PoolConfigParser::parseRelays(const nlohmann::json& json, PoolDefinition& definition) {
    if (!json.is_array()) {
        throw ConfigurationException("'relays' must be an array");
    }

    std::set<std::string> seen;
    for (const auto& relay : json) {
        std::string url;

        if (relay.is_string()) {
            url = relay.get<std::string>();
        } else if (relay.is_object()) {
            RelayConfig relayConfig = parseRelayObject(relay, definition.config.default_relay_config, url);
            definition.config.relay_configs[url] = relayConfig;
        } else {
            throw ConfigurationException("Relay entries must be strings or objects");
        }

        if (url.empty()) {
            throw ConfigurationException("Relay URL must not be empty");
        }
        if (!seen.insert(url).second) {
            throw ConfigurationException("Duplicate relay URL: " + url);
        }

        definition.relay_urls.push_back(url);
    }
}

RelayConfig PoolConfigParser::parseRelayObject(const nlohmann::json& json, const RelayConfig& defaults,
                                               std::string& url) {
    url = getString(json, "url");

    RelayConfig config = defaults;
    config.priority = getInt(json, "priority", defaults.priority);

    if (json.contains("timeout-ms")) {
        config.timeout = std::chrono::milliseconds(getUnsigned(json, "timeout-ms", 0));
    }

    if (json.contains("headers")) {
        const auto& headers = json["headers"];
        if (!headers.is_object()) {
            throw ConfigurationException("'headers' of " + url + " must be an object");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (!it.value().is_string()) {
                throw ConfigurationException("Header '" + it.key() + "' of " + url + " must be a string");
            }
            config.headers[it.key()] = it.value().get<std::string>();
        }
    }

    return config;
}

uint32_t PoolConfigParser::getUnsigned(const nlohmann::json& json, const std::string& key,
                                       uint32_t defaultValue) {
    if (!json.contains(key)) {
        return defaultValue;
    }

    const auto& value = json[key];
    if (!value.is_number_integer() || value.get<int64_t>() < 0 ||
        value.get<int64_t>() > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        throw ConfigurationException("'" + key + "' must be a non-negative integer");
    }
    return static_cast<uint32_t>(value.get<int64_t>());
}

int32_t PoolConfigParser::getInt(const nlohmann::json& json, const std::string& key,
                                 int32_t defaultValue) {
    if (!json.contains(key)) {
        return defaultValue;
    }

    const auto& value = json[key];
    if (!value.is_number_integer() ||
        value.get<int64_t>() < std::numeric_limits<int32_t>::min() ||
        value.get<int64_t>() > std::numeric_limits<int32_t>::max()) {
        throw ConfigurationException("'" + key + "' must be an integer");
    }
    return static_cast<int32_t>(value.get<int64_t>());
}

std::string PoolConfigParser::getString(const nlohmann::json& json, const std::string& key,
                                        const std::string& defaultValue) {
    if (!json.contains(key)) {
        return defaultValue;
    }

    const auto& value = json[key];
    if (!value.is_string()) {
        throw ConfigurationException("'" + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace relaypool
