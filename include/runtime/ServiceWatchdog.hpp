#pragma once

#include "runtime/Clock.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gw::concurrency { class AsyncService; }

namespace gw::runtime {

// Restarts watched services whose worker died. A service that keeps dying right after
// each restart is given up on, and failed() turns true so the process can exit non-zero
// and leave the restart to the external supervisor.
class ServiceWatchdog {
public:
    struct Options {
        std::chrono::milliseconds interval{2000};

        // Restarts in a row, without the service being seen up in between
        unsigned int max_restarts = 5;
    };

    explicit ServiceWatchdog(Options opts);
    ~ServiceWatchdog();

    ServiceWatchdog(const ServiceWatchdog&) = delete;
    ServiceWatchdog& operator=(const ServiceWatchdog&) = delete;

    void watch(const std::string& name, std::shared_ptr<concurrency::AsyncService> svc);

    void start();
    void stop();

    // One pass over the watched services. Returns false once a service is given up on.
    bool sweep();

    [[nodiscard]] bool failed() const { return failed_.load(std::memory_order_acquire); }

private:
    struct Watched {
        std::shared_ptr<concurrency::AsyncService> svc;
        unsigned int restarts = 0;
    };

    Options opts_;
    std::mutex mutex_;
    std::map<std::string, Watched> services_;
    std::atomic<bool> failed_{false};

    CancellationToken token_;
    std::thread thread_;
};

}
