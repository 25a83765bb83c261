#ifndef RELAYPOOL_UTILS_WORKER_POOL_H
#define RELAYPOOL_UTILS_WORKER_POOL_H

#include "utils/blocking_queue.h"
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace relaypool {
namespace utils {

/**
 * @brief Elastic set of worker threads for blocking calls
 *
 * Every submitted task is handed to a worker that is free at submit time.
 * When all workers are busy, submit() starts another one, so a task never
 * waits in the queue behind a slow neighbour. The relay pool relies on
 * this to bound each connect attempt by its own timeout, counted from the
 * moment it is submitted.
 *
 * Workers started on demand stay alive until shutdown() and are reused
 * by later submissions.
 *
 * Shutdown is graceful: tasks submitted before shutdown() still run, then
 * the workers exit. Exceptions thrown by a task travel through its future.
 *
 * Example Usage:
 * @code
 * WorkerPool workers(4, "connect");
 * auto future = workers.submit([&]() { return transport.connect(relay); });
 * if (future.wait_until(deadline) == std::future_status::ready) { ... }
 * @endcode
 */
class WorkerPool {
public:
    /**
     * @brief Start initialThreads workers up front
     * @param initialThreads Workers started immediately
     * @param name Label used in log output
     * @throws std::invalid_argument if initialThreads is 0
     */
    explicit WorkerPool(size_t initialThreads, std::string name = "worker");

    /**
     * @brief Calls shutdown() and joins the workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Run a callable on a free worker and obtain a future for its result
     * @throws std::runtime_error if the pool has been shut down
     */
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using ReturnType = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("Cannot submit task: worker pool '" + name_ + "' is shut down");
        }
        if (available_ == 0) {
            startWorkerLocked(true);
        }
        available_--;
        tasks_.push([task]() { (*task)(); });
        return result;
    }

    /**
     * @brief Stop accepting tasks; submitted tasks still complete
     */
    void shutdown();

    /**
     * @brief Join all workers (call after shutdown())
     */
    void wait();

    bool isShutdown() const { return shutdown_; }

    /**
     * @brief Workers started so far, including those started on demand
     */
    size_t getThreadCount() const;

    /**
     * @brief Workers waiting for a task
     */
    size_t getIdleCount() const;

    const std::string& getName() const { return name_; }

private:
    void startWorkerLocked(bool onDemand);
    void workerThread();

    using Task = std::function<void()>;

    std::string name_;
    BlockingQueue<Task> tasks_;

    mutable std::mutex mutex_;          ///< Guards workers_, available_, started_
    std::vector<std::thread> workers_;
    size_t available_;                  ///< Free workers not yet claimed by a queued task
    size_t started_;
    std::atomic<bool> shutdown_;
};

} // namespace utils
} // namespace relaypool

#endif // RELAYPOOL_UTILS_WORKER_POOL_H
