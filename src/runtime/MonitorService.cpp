#include "runtime/MonitorService.hpp"
#include "alert/DesktopSink.hpp"
#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "alert/RemoteSink.hpp"
#include "health/MemoryTrendTracker.hpp"
#include "health/Probe.hpp"
#include "log/Registry.hpp"
#include "log/Rotator.hpp"
#include "metrics/Publisher.hpp"
#include "os/Facade.hpp"
#include "recovery/Controller.hpp"
#include "runtime/Bootstrap.hpp"
#include "runtime/MonitorLoop.hpp"
#include "snapshot/Manager.hpp"
#include "state/Store.hpp"
#include "util/http.hpp"

using namespace gw::runtime;

MonitorService::MonitorService(const config::Config& cfg, std::shared_ptr<os::Facade> os,
                               std::shared_ptr<util::HttpClient> http, concurrency::ThreadPool& remotePool)
    : AsyncService("MonitorService"),
      cfg_(cfg),
      os_(std::move(os)),
      http_(std::move(http)),
      clock_(token_),
      ctx_(cfg.thresholds.leak_window) {
    journal_ = std::make_unique<alert::Journal>(cfg_.gateway.memory_dir, clock_);

    alerts_ = std::make_unique<alert::Dispatcher>(cfg_.alerts, clock_, *journal_, remotePool);
    if (cfg_.alerts.desktop.enabled)
        alerts_->addLocalSink(std::make_shared<alert::DesktopSink>(cfg_.alerts.desktop, *os_, cfg_.monitor.command_timeout));
    if (cfg_.alerts.remote.enabled)
        alerts_->addRemoteSink(std::make_shared<alert::RemoteSink>(cfg_.alerts.remote, os_));

    snapshots_ = std::make_unique<snapshot::Manager>(cfg_, *http_, *os_, clock_, *alerts_, *journal_);
    probe_ = std::make_unique<health::Probe>(cfg_, *os_, *http_, clock_, *alerts_, *snapshots_, *journal_);
    tracker_ = std::make_unique<health::MemoryTrendTracker>(cfg_.thresholds);
    recovery_ = std::make_unique<recovery::Controller>(cfg_, *os_, *probe_, *snapshots_, *alerts_, *journal_, clock_);
    store_ = std::make_unique<state::Store>(cfg_.storage.stateFile(), *os_);
    publisher_ = std::make_unique<metrics::Publisher>(cfg_.storage.metricsFile());

    log::Rotator::Options ro;
    ro.active_path = cfg_.storage.logFile();
    ro.max_bytes = cfg_.logging.max_size_bytes;
    ro.keep = cfg_.logging.keep;
    ro.on_reopen = [] { log::Registry::reopenMainLog(); };
    ro.diag_log = [](const std::string_view msg) { log::Registry::gatewatch()->info("[LogRotator] {}", msg); };
    rotator_ = std::make_unique<log::Rotator>(std::move(ro));

    bootstrap_ = std::make_unique<Bootstrap>(cfg_, Bootstrap::Components{*os_, *alerts_, *journal_, *store_});
    loop_ = std::make_unique<MonitorLoop>(cfg_, clock_, MonitorLoop::Components{
        *probe_, *tracker_, *recovery_, *alerts_, *store_, *publisher_, *rotator_
    });
}

MonitorService::~MonitorService() {
    // The worker uses members declared after the base; join before they go away
    stop();
}

void MonitorService::runLoop() {
    bootstrap_->run(ctx_);

    while (!shouldStop()) {
        const auto delay = loop_->runCycle(ctx_);
        if (delay > cfg_.monitor.check_interval)
            log::Registry::gatewatch()->warn("[MonitorService] Extended pause: next check in {}s", delay.count());
        lazySleep(delay);
    }

    log::Registry::gatewatch()->info("[MonitorService] Monitor loop exited after {} cycle(s)", ctx_.cycle);
}
