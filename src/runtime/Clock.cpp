#include "runtime/Clock.hpp"

#include <thread>

using namespace gw::runtime;

void CancellationToken::cancel() {
    {
        std::scoped_lock lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

void CancellationToken::reset() {
    std::scoped_lock lock(mutex_);
    cancelled_.store(false, std::memory_order_release);
}

bool CancellationToken::waitFor(const std::chrono::milliseconds d) {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, d, [this] { return cancelled_.load(std::memory_order_acquire); });
}

SystemClock::SystemClock(std::shared_ptr<CancellationToken> token)
    : token_(std::move(token)) {}

bool SystemClock::sleepFor(const std::chrono::milliseconds d) {
    if (!token_) {
        std::this_thread::sleep_for(d);
        return true;
    }
    return token_->waitFor(d);
}
