#include "pool/relay_pool.h"
#include "core/exceptions.h"
#include "pool/load_balancer.h"
#include "transport/loopback_transport.h"
#include "utils/log.h"
#include "utils/worker_pool.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <initializer_list>
#include <map>
#include <mutex>

namespace relaypool {

namespace {

/**
 * @brief Pool-side position of a relay
 *
 * CONNECTED and CONNECTING hold capacity; PENDING and CONNECTING are
 * reported as the pending view.
 */
enum class Slot {
    PENDING,
    CONNECTING,
    CONNECTED,
    FAILED
};

struct RelayEntry {
    RelayConnectionPtr relay;
    Slot slot = Slot::PENDING;
    uint64_t order = 0;
    EventStream<ConnectionState>::Subscription stateSubscription;
};

struct ConnectAttempt {
    std::string url;
    RelayConnectionPtr relay;
    std::future<TransportResult<bool>> result;
    std::chrono::steady_clock::time_point deadline;

    /** Set when the attempt could not be started */
    std::string failure;

    /** The transport had already connected the relay on its own */
    bool alreadyConnected = false;
};

} // namespace

class RelayPool::Impl {
public:
    Impl(const PoolConfig& config, RelayTransportPtr transport)
        : config_(config)
        , transport_(transport ? std::move(transport) : std::make_shared<LoopbackTransport>())
        , balancer_(config.load_balancing)
        , workers_(config.connect_workers, "relay-connect")
        , nextOrder_(0)
        , disposed_(false) {
    }

    // Relay state subscriptions capture this; dispose() detaches them all
    ~Impl() = default;

    bool registerRelay(const std::string& url, const RelayConfig& relayConfig) {
        auto relay = std::make_shared<RelayConnection>(url, relayConfig);
        std::weak_ptr<RelayConnection> weakRelay = relay;

        RelayEntry entry;
        entry.relay = relay;
        entry.stateSubscription = relay->getStateMachine().stateStream().subscribe(
            [this, url, weakRelay](const ConnectionState& state) {
                onRelayStateChanged(url, weakRelay.lock(), state);
            });

        std::lock_guard<std::mutex> lock(mutex_);
        if (relays_.count(url) > 0) {
            return false;
        }
        entry.order = nextOrder_++;
        relays_.emplace(url, std::move(entry));
        return true;
    }

    void ensureActive(const char* operation) const {
        if (disposed_) {
            throw UsageException(std::string("RelayPool::") + operation + " called after dispose()");
        }
    }

    // ==================================================================
    // Connection establishment
    // ==================================================================

    /**
     * @brief Registered URLs in the requested views, in attempt order
     */
    std::vector<std::string> collectCandidates(bool includePending, bool includeFailed) const {
        struct Candidate {
            std::string url;
            int32_t priority;
            uint64_t order;
        };

        std::vector<Candidate> candidates;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& kv : relays_) {
                Slot slot = kv.second.slot;
                if ((slot == Slot::PENDING && includePending) ||
                    (slot == Slot::FAILED && includeFailed)) {
                    candidates.push_back({kv.first, kv.second.relay->getConfig().priority, kv.second.order});
                }
            }
        }

        bool byPriority = config_.connection_strategy == ConnectionStrategy::PRIORITY;
        std::sort(candidates.begin(), candidates.end(),
            [byPriority](const Candidate& a, const Candidate& b) {
                if (byPriority && a.priority != b.priority) {
                    return a.priority < b.priority;
                }
                return a.order < b.order;
            });

        std::vector<std::string> urls;
        urls.reserve(candidates.size());
        for (const auto& c : candidates) {
            urls.push_back(c.url);
        }
        return urls;
    }

    /**
     * @brief Attempt candidates in rounds while capacity allows
     *
     * Each round reserves capacity (PRIORITY: one relay, PARALLEL: as many
     * as fit), starts every reserved attempt and waits for all of them.
     * Failures release their capacity, so later candidates get a chance in
     * the next round. Candidates left when capacity is exhausted keep
     * their current view.
     */
    void runAttempts(const std::vector<std::string>& candidates) {
        const bool sequential = config_.connection_strategy == ConnectionStrategy::PRIORITY;
        size_t next = 0;

        while (next < candidates.size() && !disposed_) {
            std::vector<ConnectAttempt> round;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                size_t inUse = countSlotLocked(Slot::CONNECTED) + countSlotLocked(Slot::CONNECTING);

                while (next < candidates.size() && inUse < config_.max_connections) {
                    if (sequential && !round.empty()) {
                        break;
                    }

                    const std::string& url = candidates[next++];
                    auto it = relays_.find(url);
                    if (it == relays_.end()) {
                        continue;
                    }
                    if (it->second.slot != Slot::PENDING && it->second.slot != Slot::FAILED) {
                        continue;
                    }

                    it->second.slot = Slot::CONNECTING;
                    inUse++;

                    ConnectAttempt attempt;
                    attempt.url = url;
                    attempt.relay = it->second.relay;
                    round.push_back(std::move(attempt));
                }
            }

            if (round.empty()) {
                if (next < candidates.size()) {
                    LOGD_FMT("RelayPool: at capacity (" << config_.max_connections << "), "
                             << (candidates.size() - next) << " candidates stay queued");
                }
                break;
            }

            for (auto& attempt : round) {
                startAttempt(attempt);
            }
            for (auto& attempt : round) {
                finishAttempt(attempt);
            }
        }
    }

    void startAttempt(ConnectAttempt& attempt) {
        if (!attempt.relay->onConnectAttemptStarted()) {
            ConnectionState current = attempt.relay->getState();
            if (current == ConnectionState::CONNECTED) {
                LOGD_FMT("RelayPool: " << attempt.url << " is already connected");
                attempt.alreadyConnected = true;
                return;
            }
            countAttempt();
            attempt.failure = std::string("Cannot start connection from state ") +
                              connectionStateToString(current);
            return;
        }
        countAttempt();

        bool retry = attempt.relay->getState() == ConnectionState::RECONNECTING;
        LOGD_FMT("RelayPool: " << (retry ? "reconnecting " : "connecting ") << attempt.url);
        emit(retry ? PoolEventType::RECONNECTING : PoolEventType::CONNECTING, attempt.url);

        RelayTransportPtr transport = transport_;
        RelayConnectionPtr relay = attempt.relay;
        try {
            // submit() hands the call to a free worker, so the timeout
            // starts when the connect does
            attempt.result = workers_.submit([transport, relay]() {
                return transport->connect(*relay);
            });
        } catch (const std::runtime_error& e) {
            attempt.failure = e.what();
            return;
        }
        attempt.deadline = std::chrono::steady_clock::now() + attempt.relay->getConfig().timeout;
    }

    void countAttempt() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.connect_attempts++;
    }

    bool finishAttempt(ConnectAttempt& attempt) {
        std::string failure = attempt.failure;

        if (failure.empty() && !attempt.alreadyConnected) {
            if (attempt.result.wait_until(attempt.deadline) != std::future_status::ready) {
                failure = "Connection timed out after " +
                          std::to_string(attempt.relay->getConfig().timeout.count()) + "ms";
            } else {
                try {
                    TransportResult<bool> result = attempt.result.get();
                    if (!result) {
                        failure = result.error_message.empty()
                            ? std::string(transportErrorToString(result.error))
                            : result.error_message;
                    }
                } catch (const std::exception& e) {
                    failure = std::string("Transport error: ") + e.what();
                }
            }
        }

        if (failure.empty() && !attempt.alreadyConnected && !attempt.relay->onConnectSucceeded()) {
            failure = "Connection state changed during the attempt";
        }

        if (!failure.empty()) {
            attempt.relay->onConnectFailed(failure);
            if (releaseAttempt(attempt, Slot::FAILED)) {
                LOGW_FMT("RelayPool: failed to connect " << attempt.url << ": " << failure);
                emit(PoolEventType::CONNECTION_FAILED, attempt.url, failure);
            }
            return false;
        }

        // The transport may have dropped the relay between success and now
        bool promoted = false;
        bool tracked = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = relays_.find(attempt.url);
            if (it != relays_.end() && it->second.relay == attempt.relay &&
                it->second.slot == Slot::CONNECTING) {
                tracked = true;
                if (attempt.relay->getState() == ConnectionState::CONNECTED) {
                    it->second.slot = Slot::CONNECTED;
                    promoted = true;
                } else {
                    it->second.slot = Slot::FAILED;
                    stats_.connect_failures++;
                }
            }
        }

        if (promoted) {
            LOGI_FMT("RelayPool: connected to " << attempt.url);
            relayConnectedStream_.publish(attempt.url);
            emit(PoolEventType::CONNECTED, attempt.url);
            return true;
        }

        if (tracked) {
            LOGW_FMT("RelayPool: " << attempt.url << " dropped while being established");
            emit(PoolEventType::CONNECTION_FAILED, attempt.url, "Connection lost during establishment");
        }
        return false;
    }

    /**
     * @brief Move a reserved relay out of CONNECTING
     * @return false if the relay was removed or re-registered meanwhile
     */
    bool releaseAttempt(const ConnectAttempt& attempt, Slot target) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = relays_.find(attempt.url);
        if (it == relays_.end() || it->second.relay != attempt.relay ||
            it->second.slot != Slot::CONNECTING) {
            return false;
        }
        it->second.slot = target;
        if (target == Slot::FAILED) {
            stats_.connect_failures++;
        }
        return true;
    }

    // ==================================================================
    // Connection loss
    // ==================================================================

    void onRelayStateChanged(const std::string& url, const RelayConnectionPtr& relay, ConnectionState state) {
        if (!relay) {
            return;
        }
        if (state == ConnectionState::CONNECTED) {
            onRelayConnected(url, relay);
            return;
        }
        if (state != ConnectionState::DISCONNECTED &&
            state != ConnectionState::ERROR &&
            state != ConnectionState::CLOSED) {
            return;
        }

        size_t remaining = 0;
        bool unexpected = state != ConnectionState::CLOSED;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = relays_.find(url);
            if (it == relays_.end() || it->second.relay != relay ||
                it->second.slot != Slot::CONNECTED) {
                return;
            }
            it->second.slot = Slot::FAILED;
            remaining = countSlotLocked(Slot::CONNECTED);
            if (unexpected) {
                stats_.failovers++;
            }
        }

        transport_->disconnect(*relay);

        std::string reason = relay->getStateMachine().getLastTransitionReason()
            .value_or(connectionStateToString(state));

        LOGW_FMT("RelayPool: lost " << url << " (" << reason << "), "
                 << remaining << " relays still connected");

        relayDisconnectedStream_.publish(url);
        emit(PoolEventType::RELAY_DISCONNECTED, url, reason);

        if (unexpected) {
            FailoverEvent failover;
            failover.failed_relay = url;
            failover.remaining_connections = remaining;
            failoverStream_.publish(failover);
            emit(PoolEventType::FAILOVER, url, "remaining=" + std::to_string(remaining));
        }
    }

    /**
     * @brief The transport connected a relay outside a pool attempt
     *
     * Attempts in flight (CONNECTING slot) are promoted by finishAttempt().
     * Without free capacity the relay keeps its view until an attempt
     * round reaches it.
     */
    void onRelayConnected(const std::string& url, const RelayConnectionPtr& relay) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = relays_.find(url);
            if (it == relays_.end() || it->second.relay != relay) {
                return;
            }
            if (it->second.slot != Slot::PENDING && it->second.slot != Slot::FAILED) {
                return;
            }

            size_t inUse = countSlotLocked(Slot::CONNECTED) + countSlotLocked(Slot::CONNECTING);
            if (inUse >= config_.max_connections) {
                LOGW_FMT("RelayPool: " << url << " connected by transport but the pool is at capacity ("
                         << config_.max_connections << ")");
                return;
            }
            it->second.slot = Slot::CONNECTED;
        }

        LOGI_FMT("RelayPool: " << url << " connected by transport");
        relayConnectedStream_.publish(url);
        emit(PoolEventType::CONNECTED, url, "Connected by transport");
    }

    // ==================================================================
    // Messaging
    // ==================================================================

    bool deliver(const RelayConnectionPtr& relay, const std::string& message) {
        TransportResult<bool> result;

        relay->beginRequest();
        try {
            result = transport_->send(*relay, message);
        } catch (const std::exception& e) {
            result = TransportResult<bool>::fail(TransportError::UNKNOWN_ERROR, e.what());
        }
        relay->endRequest();

        if (!result) {
            relay->getHealthMetrics().recordError();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.send_failures++;
            }
            LOGW_FMT("RelayPool: send to " << relay->getUrl() << " failed: "
                     << transportErrorToString(result.error) << " " << result.error_message);
            return false;
        }

        relay->onMessageDelivered();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.messages_sent++;
        }

        RelayMessage record;
        record.relay_url = relay->getUrl();
        record.data = message;
        messageStream_.publish(record);
        return true;
    }

    // ==================================================================
    // Teardown
    // ==================================================================

    void dispose() {
        std::vector<RelayEntry> entries;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) {
                return;
            }
            disposed_ = true;

            for (auto& kv : relays_) {
                entries.push_back(std::move(kv.second));
            }
            relays_.clear();
        }

        LOGI_FMT("RelayPool: disposing " << entries.size() << " relays");

        for (auto& entry : entries) {
            entry.stateSubscription.unsubscribe();
            transport_->disconnect(*entry.relay);
            entry.relay->close("Pool disposed");
            entry.relay->dispose();
        }

        workers_.shutdown();
        workers_.wait();

        emit(PoolEventType::DISPOSED, "");

        relayConnectedStream_.clear();
        relayDisconnectedStream_.clear();
        messageStream_.clear();
        failoverStream_.clear();
        eventStream_.clear();
    }

    // ==================================================================
    // Helpers
    // ==================================================================

    void emit(PoolEventType type, const std::string& url, const std::string& detail = "") {
        PoolEvent event;
        event.type = type;
        event.relay_url = url;
        event.detail = detail;
        event.timestamp = std::chrono::system_clock::now();
        eventStream_.publish(event);
    }

    size_t countSlotLocked(Slot slot) const {
        return static_cast<size_t>(std::count_if(relays_.begin(), relays_.end(),
            [slot](const std::pair<const std::string, RelayEntry>& kv) {
                return kv.second.slot == slot;
            }));
    }

    std::vector<RelayConnectionPtr> collectView(std::initializer_list<Slot> slots) const {
        std::vector<std::pair<uint64_t, RelayConnectionPtr>> matches;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& kv : relays_) {
                if (std::find(slots.begin(), slots.end(), kv.second.slot) != slots.end()) {
                    matches.emplace_back(kv.second.order, kv.second.relay);
                }
            }
        }

        std::sort(matches.begin(), matches.end(),
            [](const std::pair<uint64_t, RelayConnectionPtr>& a,
               const std::pair<uint64_t, RelayConnectionPtr>& b) {
                return a.first < b.first;
            });

        std::vector<RelayConnectionPtr> view;
        view.reserve(matches.size());
        for (auto& match : matches) {
            view.push_back(std::move(match.second));
        }
        return view;
    }

    const PoolConfig config_;
    RelayTransportPtr transport_;
    LoadBalancer balancer_;
    utils::WorkerPool workers_;

    std::map<std::string, RelayEntry> relays_;
    uint64_t nextOrder_;
    PoolStats stats_;
    std::atomic<bool> disposed_;
    mutable std::mutex mutex_;

    EventStream<std::string> relayConnectedStream_;
    EventStream<std::string> relayDisconnectedStream_;
    EventStream<RelayMessage> messageStream_;
    EventStream<FailoverEvent> failoverStream_;
    EventStream<PoolEvent> eventStream_;
};

// ==================================================================
// RelayPool
// ==================================================================

RelayPool::RelayPool(const std::vector<std::string>& relayUrls,
                     const PoolConfig& config,
                     RelayTransportPtr transport) {
    config.validate();
    impl_ = std::make_unique<Impl>(config, std::move(transport));

    for (const auto& url : relayUrls) {
        if (url.empty()) {
            LOGW("RelayPool: ignoring empty relay URL");
            continue;
        }
        if (!impl_->registerRelay(url, config.relayConfigFor(url))) {
            LOGW_FMT("RelayPool: duplicate relay " << url << " ignored");
        }
    }

    LOGI_FMT("RelayPool: created with " << getRelayCount() << " relays, max "
             << config.max_connections << " connections, "
             << connectionStrategyToString(config.connection_strategy) << " / "
             << loadBalancingStrategyToString(config.load_balancing));
}

RelayPool::RelayPool(const PoolDefinition& definition, RelayTransportPtr transport)
    : RelayPool(definition.relay_urls, definition.config, std::move(transport)) {
}

RelayPool::~RelayPool() {
    if (impl_) {
        impl_->dispose();
    }
}

void RelayPool::connectAll() {
    impl_->ensureActive("connectAll");
    LOGD("RelayPool: connectAll");

    impl_->runAttempts(impl_->collectCandidates(true, true));
}

void RelayPool::reconnectFailed() {
    impl_->ensureActive("reconnectFailed");

    auto candidates = impl_->collectCandidates(false, true);
    LOGD_FMT("RelayPool: reconnecting " << candidates.size() << " failed relays");
    impl_->runAttempts(candidates);
}

bool RelayPool::addRelay(const std::string& url, const std::optional<RelayConfig>& config) {
    impl_->ensureActive("addRelay");

    if (url.empty()) {
        LOGW("RelayPool: addRelay with empty URL");
        return false;
    }

    RelayConfig relayConfig = config ? *config : impl_->config_.relayConfigFor(url);
    if (!impl_->registerRelay(url, relayConfig)) {
        LOGW_FMT("RelayPool: " << url << " is already registered");
        return false;
    }

    LOGI_FMT("RelayPool: added " << url);
    impl_->emit(PoolEventType::RELAY_ADDED, url);

    impl_->runAttempts({url});
    return true;
}

bool RelayPool::removeRelay(const std::string& url) {
    impl_->ensureActive("removeRelay");

    RelayEntry removed;
    bool wasConnected = false;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        auto it = impl_->relays_.find(url);
        if (it == impl_->relays_.end()) {
            LOGW_FMT("RelayPool: removeRelay on unknown relay " << url);
            return false;
        }
        wasConnected = it->second.slot == Slot::CONNECTED;
        removed = std::move(it->second);
        impl_->relays_.erase(it);
    }

    removed.stateSubscription.unsubscribe();
    impl_->transport_->disconnect(*removed.relay);
    removed.relay->close("Removed from pool");
    removed.relay->dispose();

    LOGI_FMT("RelayPool: removed " << url);
    impl_->emit(PoolEventType::RELAY_REMOVED, url);

    if (wasConnected) {
        impl_->relayDisconnectedStream_.publish(url);
        impl_->emit(PoolEventType::RELAY_DISCONNECTED, url, "Removed from pool");
    }

    impl_->runAttempts(impl_->collectCandidates(true, false));
    return true;
}

void RelayPool::dispose() {
    impl_->dispose();
}

bool RelayPool::isDisposed() const {
    return impl_->disposed_;
}

size_t RelayPool::broadcast(const std::string& message) {
    impl_->ensureActive("broadcast");

    auto targets = impl_->collectView({Slot::CONNECTED});
    size_t delivered = 0;
    for (const auto& relay : targets) {
        if (impl_->deliver(relay, message)) {
            delivered++;
        }
    }

    LOGD_FMT("RelayPool: broadcast delivered to " << delivered << "/" << targets.size() << " relays");
    impl_->emit(PoolEventType::MESSAGE_SENT, "",
                "delivered=" + std::to_string(delivered) + "/" + std::to_string(targets.size()));
    return delivered;
}

bool RelayPool::sendToRelay(const std::string& url, const std::string& message) {
    impl_->ensureActive("sendToRelay");

    RelayConnectionPtr relay;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        auto it = impl_->relays_.find(url);
        if (it != impl_->relays_.end() && it->second.slot == Slot::CONNECTED) {
            relay = it->second.relay;
        }
    }

    if (!relay) {
        LOGW_FMT("RelayPool: sendToRelay: " << url << " is not connected");
        return false;
    }

    if (!impl_->deliver(relay, message)) {
        return false;
    }

    impl_->emit(PoolEventType::MESSAGE_SENT, url, "delivered=1/1");
    return true;
}

RelayConnectionPtr RelayPool::selectRelay() {
    impl_->ensureActive("selectRelay");

    auto candidates = impl_->collectView({Slot::CONNECTED});
    if (candidates.empty()) {
        LOGW("RelayPool: selectRelay with no connected relays");
        return nullptr;
    }
    return impl_->balancer_.selectRelay(candidates);
}

RelayConnectionPtr RelayPool::getRelay(const std::string& url) const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    auto it = impl_->relays_.find(url);
    if (it == impl_->relays_.end()) {
        return nullptr;
    }
    return it->second.relay;
}

std::vector<RelayConnectionPtr> RelayPool::getConnectedRelays() const {
    return impl_->collectView({Slot::CONNECTED});
}

std::vector<RelayConnectionPtr> RelayPool::getFailedRelays() const {
    return impl_->collectView({Slot::FAILED});
}

std::vector<RelayConnectionPtr> RelayPool::getPendingRelays() const {
    return impl_->collectView({Slot::PENDING, Slot::CONNECTING});
}

size_t RelayPool::getConnectionCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->countSlotLocked(Slot::CONNECTED);
}

bool RelayPool::isConnected() const {
    return getConnectionCount() > 0;
}

size_t RelayPool::getRelayCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->relays_.size();
}

std::vector<std::string> RelayPool::getRelayUrls() const {
    std::vector<std::string> urls;
    for (const auto& relay : impl_->collectView({Slot::PENDING, Slot::CONNECTING, Slot::CONNECTED, Slot::FAILED})) {
        urls.push_back(relay->getUrl());
    }
    return urls;
}

PoolConnectionState RelayPool::getOverallState() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return computeOverallState(impl_->countSlotLocked(Slot::CONNECTED), impl_->relays_.size());
}

PoolStats RelayPool::getStats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    PoolStats stats = impl_->stats_;
    stats.registered_relays = impl_->relays_.size();
    stats.connected_relays = impl_->countSlotLocked(Slot::CONNECTED);
    stats.failed_relays = impl_->countSlotLocked(Slot::FAILED);
    stats.pending_relays = impl_->countSlotLocked(Slot::PENDING) + impl_->countSlotLocked(Slot::CONNECTING);
    return stats;
}

const PoolConfig& RelayPool::getConfig() const {
    return impl_->config_;
}

PoolConnectionState RelayPool::computeOverallState(size_t connected, size_t total) {
    if (connected == 0) {
        return PoolConnectionState::DISCONNECTED;
    }
    if (connected >= total) {
        return PoolConnectionState::CONNECTED;
    }
    if (2 * connected < total) {
        return PoolConnectionState::DEGRADED;
    }
    return PoolConnectionState::PARTIAL;
}

EventStream<std::string>& RelayPool::relayConnectedStream() {
    return impl_->relayConnectedStream_;
}

EventStream<std::string>& RelayPool::relayDisconnectedStream() {
    return impl_->relayDisconnectedStream_;
}

EventStream<RelayMessage>& RelayPool::messageStream() {
    return impl_->messageStream_;
}

EventStream<FailoverEvent>& RelayPool::failoverStream() {
    return impl_->failoverStream_;
}

EventStream<PoolEvent>& RelayPool::eventStream() {
    return impl_->eventStream_;
}

} // namespace relaypool
