#include "runtime/ServiceWatchdog.hpp"
#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace gw::runtime;

ServiceWatchdog::ServiceWatchdog(Options opts) : opts_(opts) {}

ServiceWatchdog::~ServiceWatchdog() {
    stop();
}

void ServiceWatchdog::watch(const std::string& name, std::shared_ptr<concurrency::AsyncService> svc) {
    if (!svc) throw std::invalid_argument("null service: " + name);
    std::scoped_lock lock(mutex_);
    services_[name] = Watched{std::move(svc), 0};
}

void ServiceWatchdog::start() {
    if (thread_.joinable()) return;
    token_.reset();

    thread_ = std::thread([this] {
        log::Registry::gatewatch()->info("[ServiceManager] Watchdog started.");
        while (token_.waitFor(opts_.interval))
            if (!sweep()) break;
        log::Registry::gatewatch()->info("[ServiceManager] Watchdog stopped.");
    });
}

void ServiceWatchdog::stop() {
    token_.cancel();
    if (thread_.joinable()) thread_.join();
}

bool ServiceWatchdog::sweep() {
    std::scoped_lock lock(mutex_);

    for (auto& [name, w] : services_) {
        if (w.svc->isRunning()) {
            w.restarts = 0;
            continue;
        }

        if (w.restarts >= opts_.max_restarts) {
            log::Registry::gatewatch()->critical("[Watchdog] {} died {} time(s) in a row, giving up", name, w.restarts + 1);
            failed_.store(true, std::memory_order_release);
            return false;
        }

        ++w.restarts;
        log::Registry::gatewatch()->warn("[Watchdog] {} is down, restarting (attempt {}/{})...",
                                         name, w.restarts, opts_.max_restarts);
        w.svc->restart();
    }

    return true;
}
