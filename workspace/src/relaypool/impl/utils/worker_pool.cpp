#include "utils/worker_pool.h"
#include "utils/log.h"

namespace relaypool {
namespace utils {

WorkerPool::WorkerPool(size_t initialThreads, std::string name)
    : name_(std::move(name))
    , available_(0)
    , started_(0)
    , shutdown_(false)
{
    if (initialThreads == 0) {
        throw std::invalid_argument("Worker pool must start at least one thread");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < initialThreads; ++i) {
        startWorkerLocked(false);
    }
    LOGD_FMT("WorkerPool '" << name_ << "' started with " << initialThreads << " threads");
}

WorkerPool::~WorkerPool() {
    shutdown();
    wait();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
    }

    // Workers drain what was submitted, then pop() returns nullopt
    tasks_.close();
}

void WorkerPool::wait() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::getThreadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

size_t WorkerPool::getIdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void WorkerPool::startWorkerLocked(bool onDemand) {
    workers_.emplace_back(&WorkerPool::workerThread, this);
    available_++;
    started_++;

    if (onDemand) {
        LOGV_FMT("WorkerPool '" << name_ << "': all workers busy, now " << started_ << " threads");
    }
}

void WorkerPool::workerThread() {
    while (true) {
        auto task = tasks_.pop();
        if (!task.has_value()) {
            break;
        }

        // packaged_task stores any exception in the task's future
        task.value()();

        std::lock_guard<std::mutex> lock(mutex_);
        available_++;
    }
}

} // namespace utils
} // namespace relaypool
