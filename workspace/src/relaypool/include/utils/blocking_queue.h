#ifndef RELAYPOOL_UTILS_BLOCKING_QUEUE_H
#define RELAYPOOL_UTILS_BLOCKING_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace relaypool {
namespace utils {

/**
 * @brief Exception thrown when pushing onto a closed queue
 */
class QueueClosedException : public std::runtime_error {
public:
    QueueClosedException() : std::runtime_error("Queue is closed") {}
};

/**
 * @brief Unbounded multi-producer / multi-consumer queue
 *
 * Consumers block in pop() until an item arrives or the queue is closed.
 * Items pushed before close() are still handed out, so a closed queue
 * drains before pop() starts returning std::nullopt.
 *
 * Thread-Safety: All methods are thread-safe
 */
template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    ~BlockingQueue() {
        close();
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @brief Append an item
     * @throws QueueClosedException if queue is closed
     */
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw QueueClosedException();
            }
            items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
    }

    /**
     * @brief Pop the oldest item, blocking until one is available
     * @return Item, or std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this]() {
            return !items_.empty() || closed_;
        });

        if (items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief Pop without blocking
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * @brief Refuse further pushes and wake every blocked consumer
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
    }

private:
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
};

} // namespace utils
} // namespace relaypool

#endif // RELAYPOOL_UTILS_BLOCKING_QUEUE_H
