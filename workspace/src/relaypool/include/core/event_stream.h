#ifndef RELAYPOOL_CORE_EVENT_STREAM_H
#define RELAYPOOL_CORE_EVENT_STREAM_H

#include "utils/log.h"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace relaypool {

/**
 * @brief Synchronous multicast channel
 *
 * Features:
 * - Fan-out of every published value to all current subscribers
 * - No buffering and no replay: late subscribers only see later values
 * - Deliveries are serialized, so every subscriber observes values in
 *   publish order, each exactly once
 * - A subscriber may publish, subscribe or unsubscribe from inside its
 *   own callback (same thread re-entry is allowed)
 *
 * Callbacks run on the publishing thread. An exception escaping a callback
 * is logged and delivery continues with the next subscriber.
 *
 * Example Usage:
 * @code
 * EventStream<int> numbers;
 * auto sub = numbers.subscribe([](const int& n) { handle(n); });
 * numbers.publish(42);
 * sub.unsubscribe();
 * @endcode
 *
 * @tparam T Value type delivered to subscribers
 */
template<typename T>
class EventStream {
public:
    using Callback = std::function<void(const T&)>;

private:
    struct Entry {
        uint64_t id;
        Callback callback;
        std::atomic<bool> active{true};

        Entry(uint64_t entryId, Callback cb)
            : id(entryId), callback(std::move(cb)) {}
    };

    struct State {
        std::mutex mutex;                        ///< Guards entries / nextId
        std::recursive_mutex deliveryMutex;      ///< Serializes deliveries
        std::vector<std::shared_ptr<Entry>> entries;
        uint64_t nextId = 1;
    };

public:
    /**
     * @brief Handle for one registered callback
     *
     * Move-only. Destroying the handle unsubscribes. Once unsubscribe()
     * returns, the callback is not invoked again.
     */
    class Subscription {
    public:
        Subscription() = default;

        ~Subscription() { unsubscribe(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept
            : state_(std::move(other.state_))
            , id_(other.id_) {
            other.id_ = 0;
        }

        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                unsubscribe();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        /**
         * @brief Detach the callback (idempotent)
         */
        void unsubscribe() {
            auto state = state_.lock();
            state_.reset();
            if (!state || id_ == 0) {
                id_ = 0;
                return;
            }

            // Waits for a delivery running on another thread to finish
            std::lock_guard<std::recursive_mutex> delivery(state->deliveryMutex);
            std::lock_guard<std::mutex> lock(state->mutex);
            auto it = std::find_if(state->entries.begin(), state->entries.end(),
                [this](const std::shared_ptr<Entry>& e) { return e->id == id_; });
            if (it != state->entries.end()) {
                (*it)->active = false;
                state->entries.erase(it);
            }
            id_ = 0;
        }

        /**
         * @brief True while the callback is registered
         */
        bool isActive() const {
            return id_ != 0 && !state_.expired();
        }

    private:
        friend class EventStream;

        Subscription(std::weak_ptr<State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    EventStream() : state_(std::make_shared<State>()) {}

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /**
     * @brief Register a callback for every value published from now on
     * @return Subscription handle; keep it alive to keep receiving
     */
    Subscription subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        uint64_t id = state_->nextId++;
        state_->entries.push_back(std::make_shared<Entry>(id, std::move(callback)));
        return Subscription(state_, id);
    }

    /**
     * @brief Deliver value to every current subscriber, in registration order
     */
    void publish(const T& value) {
        std::lock_guard<std::recursive_mutex> delivery(state_->deliveryMutex);

        std::vector<std::shared_ptr<Entry>> snapshot;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            snapshot = state_->entries;
        }

        for (const auto& entry : snapshot) {
            if (!entry->active || !entry->callback) {
                continue;
            }
            try {
                entry->callback(value);
            } catch (const std::exception& e) {
                LOGE_FMT("EventStream: subscriber " << entry->id << " threw: " << e.what());
            }
        }
    }

    /**
     * @brief Number of registered callbacks
     */
    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->entries.size();
    }

    /**
     * @brief Drop every subscriber
     */
    void clear() {
        std::lock_guard<std::recursive_mutex> delivery(state_->deliveryMutex);
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto& entry : state_->entries) {
            entry->active = false;
        }
        state_->entries.clear();
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace relaypool

#endif // RELAYPOOL_CORE_EVENT_STREAM_H
