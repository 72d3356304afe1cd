#include "recovery/Controller.hpp"
#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "health/Probe.hpp"
#include "health/Snapshot.hpp"
#include "log/Registry.hpp"
#include "runtime/Context.hpp"
#include "snapshot/Manager.hpp"

#include <fmt/format.h>

using namespace gw::recovery;
using gw::alert::Severity;

Controller::Controller(const config::Config& cfg, os::Facade& os, health::Probe& probe, snapshot::Manager& snapshots,
                       alert::Dispatcher& alerts, const alert::Journal& journal, runtime::Clock& clock)
    : cfg_(cfg), os_(os), probe_(probe), snapshots_(snapshots), alerts_(alerts), journal_(journal), clock_(clock) {}

bool Controller::ceilingReached(const runtime::Context& ctx) const {
    return ctx.restart.attempts >= cfg_.recovery.max_attempts;
}

void Controller::recovered(runtime::Context& ctx) const {
    ctx.restart.attempts = 0;
    ctx.phase = Phase::Healthy;
}

bool Controller::settle(const std::chrono::seconds d) {
    if (clock_.sleepFor(d)) return true;
    log::Registry::recovery()->warn("[RecoveryController] Settle wait interrupted by shutdown");
    interrupted_ = true;
    return false;
}

Phase Controller::handle(runtime::Context& ctx, const health::HealthSnapshot& snapshot) {
    interrupted_ = false;
    ctx.phase = Phase::Degraded;

    if (snapshot.process_running && snapshot.pid) {
        os::ProcessInfo process;
        process.pid = *snapshot.pid;
        process.memory_mb = snapshot.memory_mb;
        process.cpu_percent = snapshot.cpu_percent;

        if (gracefulRestart(ctx, process, "Health check failed")) return ctx.phase;
        if (interrupted_) return ctx.phase;
    }

    // Nothing to signal when the process is gone: straight to the supervisor
    if (ceilingReached(ctx)) {
        exhaust(ctx, snapshot.process_running);
        return ctx.phase;
    }

    if (hardRestart(ctx)) return ctx.phase;
    if (!interrupted_ && ceilingReached(ctx)) exhaust(ctx, snapshot.process_running);
    return ctx.phase;
}

bool Controller::gracefulRestart(runtime::Context& ctx, const os::ProcessInfo& process, const std::string_view reason) {
    ctx.phase = Phase::GracefulRestartAttempted;
    log::Registry::recovery()->info("[RecoveryController] Attempting graceful restart via {}: {}",
                                    cfg_.gateway.graceful_signal, reason);

    snapshots_.capture();

    if (!os_.sendGracefulSignal(process.pid)) {
        log::Registry::recovery()->warn("[RecoveryController] Graceful restart failed: could not signal pid {}", process.pid);
        return false;
    }

    if (!settle(cfg_.recovery.graceful_settle)) return false;

    if (probe_.checkHttp(ctx).healthy) {
        log::Registry::recovery()->info("[RecoveryController] Graceful restart successful");
        journal_.append("🔄 Graceful restart successful");
        alerts_.notify(ctx, "restart_success", "Graceful restart completed", Severity::Info);
        recovered(ctx);
        return true;
    }

    log::Registry::recovery()->warn("[RecoveryController] Graceful restart failed");
    return false;
}

bool Controller::hardRestart(runtime::Context& ctx) {
    ctx.phase = Phase::HardRestartAttempted;
    const auto attempt = ctx.restart.attempts + 1;
    log::Registry::recovery()->warn("[RecoveryController] Attempting hard restart (attempt {}/{})...",
                                    attempt, cfg_.recovery.max_attempts);
    journal_.append(fmt::format("⚠️ Hard restart attempt {}", attempt));

    snapshots_.capture();
    snapshots_.emergencyBackup();

    const auto result = os_.runSupervisorRestart(cfg_.gateway.service_id);
    if (!result.ok())
        log::Registry::recovery()->error("[RecoveryController] Supervisor restart of {} failed (launched={}, timed_out={}, exit={})",
                                         cfg_.gateway.service_id, result.launched, result.timed_out, result.exit_code);

    if (!settle(cfg_.recovery.hard_settle)) return false;

    if (probe_.checkHttp(ctx).healthy) {
        log::Registry::recovery()->info("[RecoveryController] Gateway recovered!");
        journal_.append("✅ Gateway recovered");
        alerts_.notify(ctx, "recovery", "Gateway recovered after hard restart", Severity::Success);
        recovered(ctx);
        return true;
    }

    ++ctx.restart.attempts;
    log::Registry::recovery()->error("[RecoveryController] Hard restart attempt {} failed", attempt);
    return false;
}

void Controller::exhaust(runtime::Context& ctx, const bool processPresent) {
    ctx.phase = Phase::Exhausted;

    if (processPresent)
        alerts_.notify(ctx, "gateway_unresponsive", "Gateway unresponsive! Manual intervention needed.", Severity::Critical);
    else
        alerts_.notify(ctx, "gateway_down", "Gateway down! Max restart attempts reached.", Severity::Critical);

    ctx.restart.attempts = 0;
    ctx.pause_override = cfg_.alerts.cooldown;

    log::Registry::recovery()->error("[RecoveryController] Max restart attempts reached, pausing checks for {}s",
                                     cfg_.alerts.cooldown.count());
}
