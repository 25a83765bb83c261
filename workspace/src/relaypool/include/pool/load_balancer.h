#ifndef RELAYPOOL_POOL_LOAD_BALANCER_H
#define RELAYPOOL_POOL_LOAD_BALANCER_H

#include "connection/relay_connection.h"
#include "pool/pool_types.h"
#include <mutex>
#include <vector>

namespace relaypool {

/**
 * @brief Picks one relay out of a candidate list
 *
 * Candidates are never modified. The only state is the round-robin cursor,
 * which advances once per selectRelay() call on this instance.
 *
 * Lowest-latency ignores candidates without a latency sample; if none of
 * them has one, the first candidate is returned. Every strategy breaks
 * ties by candidate order.
 */
class LoadBalancer {
public:
    explicit LoadBalancer(LoadBalancingStrategy strategy = LoadBalancingStrategy::ROUND_ROBIN);

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    /**
     * @brief Choose a relay
     * @param candidates Non-empty candidate list, in preference order
     * @throws std::invalid_argument if candidates is empty
     */
    RelayConnectionPtr selectRelay(const std::vector<RelayConnectionPtr>& candidates);

    LoadBalancingStrategy getStrategy() const { return strategy_; }

    /**
     * @brief Restart round-robin from the first candidate
     */
    void resetCursor();

private:
    RelayConnectionPtr selectRoundRobin(const std::vector<RelayConnectionPtr>& candidates);
    RelayConnectionPtr selectLeastConnections(const std::vector<RelayConnectionPtr>& candidates) const;
    RelayConnectionPtr selectLowestLatency(const std::vector<RelayConnectionPtr>& candidates) const;

    const LoadBalancingStrategy strategy_;
    size_t cursor_;
    std::mutex mutex_;
};

} // namespace relaypool

#endif // RELAYPOOL_POOL_LOAD_BALANCER_H
