#include "runtime/Manager.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "os/LinuxFacade.hpp"
#include "runtime/MonitorService.hpp"
#include "util/http.hpp"


namespace gw::runtime {

Manager& Manager::instance() {
    static Manager instance;
    return instance;
}

Manager::Manager() {
    const auto& cfg = config::ConfigRegistry::get();

    remotePool = std::make_unique<concurrency::ThreadPool>(cfg.alerts.remote.workers, cfg.alerts.remote.queue_limit);

    auto os = std::make_shared<os::LinuxFacade>(cfg.gateway.graceful_signal, cfg.gateway.restart_command,
                                                cfg.monitor.command_timeout);
    monitorService = std::make_shared<MonitorService>(cfg, std::move(os), std::make_shared<util::CurlHttpClient>(), *remotePool);

    services_["MonitorService"] = monitorService;
    for (const auto& [name, svc] : services_) watchdog_.watch(name, svc);
}

Manager::~Manager() {
    // Queued remote alerts reference the facade the monitor owns; drain them while it is alive
    watchdog_.stop();
    if (monitorService) monitorService->stop();
    if (remotePool) remotePool->stop();
    remotePool.reset();
    services_.clear();
    monitorService.reset();
}

void Manager::startAll() {
    log::Registry::gatewatch()->debug("[ServiceManager] Starting all services...");
    std::scoped_lock lock(mutex_);
    for (const auto& [name, svc] : services_) tryStart(name, svc);
    watchdog_.start();
    log::Registry::gatewatch()->debug("[ServiceManager] All services started.");
}

void Manager::stopAll(const int signal) {
    log::Registry::gatewatch()->debug("[ServiceManager] Stopping all services...");
    watchdog_.stop();
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) stopService(name, svc, signal);
    }

    // Let queued remote alerts go out before exit
    remotePool->stop();
    log::Registry::gatewatch()->debug("[ServiceManager] All services stopped.");
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    log::Registry::gatewatch()->debug("[ServiceManager] Starting service: {}", name);
    svc->start();
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc, const int signal) {
    if (!svc) return;

    log::Registry::gatewatch()->debug("[ServiceManager] Stopping service: {} (signal {})", name, signal);
    try {
        svc->stop();
    } catch (const std::exception& e) {
        log::Registry::gatewatch()->error("[ServiceManager] Failed to stop {} gracefully: {}", name, e.what());
    }
}

}
