#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gw::concurrency {

// Fixed worker count, bounded queue. submit() refuses work instead of blocking the caller.
class ThreadPool {
public:
    ThreadPool(unsigned int nThreads, size_t queueLimit);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Workers finish the queued tasks, then exit.
    void stop();

    // false if the queue is full or the pool is stopped
    [[nodiscard]] bool submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const { return static_cast<unsigned int>(threads_.size()); }
    [[nodiscard]] size_t queueLimit() const { return queueLimit_; }

private:
    void spawnWorker();

    size_t queueLimit_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace gw::concurrency
