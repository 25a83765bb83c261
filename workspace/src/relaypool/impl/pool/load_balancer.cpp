#include "pool/load_balancer.h"
#include "utils/log.h"
#include <stdexcept>

namespace relaypool {

LoadBalancer::LoadBalancer(LoadBalancingStrategy strategy)
    : strategy_(strategy)
    , cursor_(0) {
}

RelayConnectionPtr LoadBalancer::selectRelay(const std::vector<RelayConnectionPtr>& candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("LoadBalancer: no candidates to select from");
    }

    switch (strategy_) {
        case LoadBalancingStrategy::ROUND_ROBIN:
            return selectRoundRobin(candidates);

        case LoadBalancingStrategy::LEAST_CONNECTIONS:
            return selectLeastConnections(candidates);

        case LoadBalancingStrategy::LOWEST_LATENCY:
            return selectLowestLatency(candidates);
    }

    return candidates.front();
}

void LoadBalancer::resetCursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_ = 0;
}

RelayConnectionPtr LoadBalancer::selectRoundRobin(const std::vector<RelayConnectionPtr>& candidates) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t idx = cursor_ % candidates.size();
    cursor_ = idx + 1;
    return candidates[idx];
}

RelayConnectionPtr LoadBalancer::selectLeastConnections(const std::vector<RelayConnectionPtr>& candidates) const {
    RelayConnectionPtr best;
    uint32_t bestLoad = 0;

    for (const auto& relay : candidates) {
        uint32_t load = relay->getActiveRequestCount();
        if (!best || load < bestLoad) {
            best = relay;
            bestLoad = load;
        }
    }

    return best;
}

RelayConnectionPtr LoadBalancer::selectLowestLatency(const std::vector<RelayConnectionPtr>& candidates) const {
    RelayConnectionPtr best;
    std::chrono::milliseconds bestLatency(0);

    for (const auto& relay : candidates) {
        auto latency = relay->getHealthMetrics().getAverageLatency();
        if (!latency) {
            continue;
        }
        if (!best || *latency < bestLatency) {
            best = relay;
            bestLatency = *latency;
        }
    }

    if (!best) {
        LOGD_FMT("LoadBalancer: no latency samples, using first candidate " << candidates.front()->getUrl());
        return candidates.front();
    }

    return best;
}

} // namespace relaypool
