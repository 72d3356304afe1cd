#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace gw::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads, const size_t queueLimit)
    : queueLimit_(std::max<size_t>(queueLimit, 1)) {
    for (unsigned int i = 0; i < std::max(nThreads, 1u); ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    if (stopFlag.exchange(true)) return;
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    if (!task) return false;
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load() || queue.size() >= queueLimit_) return false;
        queue.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::gatewatch()->error("[ThreadPool] {} failed: {}", task->describe(), e.what());
            }
        }
    });
}
