#include "connection/health_metrics.h"

namespace relaypool {

void HealthMetrics::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    successCount_++;
}

void HealthMetrics::recordError() {
    std::lock_guard<std::mutex> lock(mutex_);
    errorCount_++;
}

void HealthMetrics::recordLatency(std::chrono::milliseconds latency) {
    if (latency.count() < 0) {
        latency = std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    latencySamples_.push_back(latency);
    latencySum_ += latency;

    if (latencySamples_.size() > MAX_LATENCY_SAMPLES) {
        latencySum_ -= latencySamples_.front();
        latencySamples_.pop_front();
    }
}

uint64_t HealthMetrics::getSuccessCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return successCount_;
}

uint64_t HealthMetrics::getErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorCount_;
}

double HealthMetrics::getErrorRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorRateLocked();
}

std::optional<std::chrono::milliseconds> HealthMetrics::getAverageLatency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return averageLatencyLocked();
}

std::optional<std::chrono::milliseconds> HealthMetrics::getLastLatency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (latencySamples_.empty()) {
        return std::nullopt;
    }
    return latencySamples_.back();
}

size_t HealthMetrics::getSampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latencySamples_.size();
}

double HealthMetrics::getHealthScore() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthScoreLocked();
}

bool HealthMetrics::isHealthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthScoreLocked() > HEALTHY_THRESHOLD;
}

HealthSnapshot HealthMetrics::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    HealthSnapshot snap;
    snap.success_count = successCount_;
    snap.error_count = errorCount_;
    snap.error_rate = errorRateLocked();
    if (!latencySamples_.empty()) {
        snap.last_latency = latencySamples_.back();
    }
    snap.average_latency = averageLatencyLocked();
    snap.health_score = healthScoreLocked();
    snap.healthy = snap.health_score > HEALTHY_THRESHOLD;
    return snap;
}

void HealthMetrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    successCount_ = 0;
    errorCount_ = 0;
    latencySamples_.clear();
    latencySum_ = std::chrono::milliseconds(0);
}

double HealthMetrics::errorRateLocked() const {
    uint64_t total = successCount_ + errorCount_;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(errorCount_) / static_cast<double>(total);
}

std::optional<std::chrono::milliseconds> HealthMetrics::averageLatencyLocked() const {
    if (latencySamples_.empty()) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(
        latencySum_.count() / static_cast<long long>(latencySamples_.size()));
}

double HealthMetrics::healthScoreLocked() const {
    double errorFactor = static_cast<double>(successCount_ + 1) /
                         static_cast<double>(successCount_ + errorCount_ + 1);

    double latencyFactor = 1.0;
    if (!latencySamples_.empty()) {
        double averageMs = static_cast<double>(latencySum_.count()) /
                           static_cast<double>(latencySamples_.size());
        latencyFactor = 1.0 / (1.0 + averageMs / LATENCY_REFERENCE_MS);
    }

    return errorFactor * latencyFactor;
}

} // namespace relaypool
