#pragma once

#include "runtime/ServiceWatchdog.hpp"

#include <csignal>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace gw::concurrency { class AsyncService; class ThreadPool; }

namespace gw::runtime {

class MonitorService;

class Manager {
public:
    static Manager& instance();

    void startAll();
    void stopAll(int signal = SIGTERM);

    // True once the watchdog gave up on a service; the process should exit non-zero
    [[nodiscard]] bool failed() const { return watchdog_.failed(); }

    // prevent accidental copies
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

private:
    Manager();
    ~Manager();

    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc, int signal);

    // Remote alert delivery; must outlive the monitor
    std::unique_ptr<concurrency::ThreadPool> remotePool;
    std::shared_ptr<MonitorService> monitorService;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    ServiceWatchdog watchdog_{ServiceWatchdog::Options{}};
};

}
