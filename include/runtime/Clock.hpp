#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace gw::runtime {

using TimePoint = std::chrono::system_clock::time_point;

class CancellationToken {
public:
    void cancel();
    void reset();

    [[nodiscard]] bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Blocks for d or until cancel(); returns false if cancelled.
    bool waitFor(std::chrono::milliseconds d);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;

    // Returns false if the wait was interrupted
    virtual bool sleepFor(std::chrono::milliseconds d) = 0;
};

class SystemClock final : public Clock {
public:
    explicit SystemClock(std::shared_ptr<CancellationToken> token);

    [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
    bool sleepFor(std::chrono::milliseconds d) override;

private:
    std::shared_ptr<CancellationToken> token_;
};

}
