/**
 * @file health_metrics.h
 * @brief Rolling reliability and latency statistics for one relay
 *
 * Score formula (1.0 when nothing has been recorded):
 *   errorFactor   = (successes + 1) / (successes + errors + 1)
 *   latencyFactor = 1 / (1 + averageLatencyMs / 1000)
 *   healthScore   = errorFactor * latencyFactor
 *
 * Each recorded error strictly lowers the score; a higher average latency
 * lowers it as well. A relay is healthy while the score is above 0.5.
 */

#ifndef RELAYPOOL_CONNECTION_HEALTH_METRICS_H
#define RELAYPOOL_CONNECTION_HEALTH_METRICS_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace relaypool {

/**
 * @brief Point-in-time copy of a relay's health
 */
struct HealthSnapshot {
    uint64_t success_count = 0;
    uint64_t error_count = 0;
    double error_rate = 0.0;
    std::optional<std::chrono::milliseconds> last_latency;
    std::optional<std::chrono::milliseconds> average_latency;
    double health_score = 1.0;
    bool healthy = true;
};

/**
 * @brief Health metrics tracker
 *
 * Thread-safe. Counters only grow (until reset()); the latency buffer keeps
 * the most recent MAX_LATENCY_SAMPLES samples.
 */
class HealthMetrics {
public:
    /** Latency samples retained for the rolling average */
    static constexpr size_t MAX_LATENCY_SAMPLES = 100;

    /** Score at or below which a relay counts as unhealthy */
    static constexpr double HEALTHY_THRESHOLD = 0.5;

    /** Average latency that halves the latency factor */
    static constexpr double LATENCY_REFERENCE_MS = 1000.0;

    HealthMetrics() = default;

    HealthMetrics(const HealthMetrics&) = delete;
    HealthMetrics& operator=(const HealthMetrics&) = delete;

    void recordSuccess();
    void recordError();
    void recordLatency(std::chrono::milliseconds latency);

    uint64_t getSuccessCount() const;
    uint64_t getErrorCount() const;

    /**
     * @brief errors / (successes + errors), 0 when nothing recorded
     */
    double getErrorRate() const;

    /**
     * @brief Mean of the retained samples, empty when none
     */
    std::optional<std::chrono::milliseconds> getAverageLatency() const;

    /**
     * @brief Most recent sample, empty when none
     */
    std::optional<std::chrono::milliseconds> getLastLatency() const;

    size_t getSampleCount() const;

    /**
     * @brief Score in [0, 1], see file header for the formula
     */
    double getHealthScore() const;

    bool isHealthy() const;

    HealthSnapshot snapshot() const;

    /**
     * @brief Forget all counters and samples
     */
    void reset();

private:
    double errorRateLocked() const;
    std::optional<std::chrono::milliseconds> averageLatencyLocked() const;
    double healthScoreLocked() const;

    uint64_t successCount_ = 0;
    uint64_t errorCount_ = 0;
    std::deque<std::chrono::milliseconds> latencySamples_;
    std::chrono::milliseconds latencySum_{0};

    mutable std::mutex mutex_;
};

} // namespace relaypool

#endif // RELAYPOOL_CONNECTION_HEALTH_METRICS_H
