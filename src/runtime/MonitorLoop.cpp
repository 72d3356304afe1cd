#include "runtime/MonitorLoop.hpp"
#include "alert/Dispatcher.hpp"
#include "health/MemoryTrendTracker.hpp"
#include "health/Probe.hpp"
#include "health/Snapshot.hpp"
#include "log/Registry.hpp"
#include "log/Rotator.hpp"
#include "metrics/Publisher.hpp"
#include "recovery/Controller.hpp"
#include "runtime/Context.hpp"
#include "state/Store.hpp"

#include <fmt/format.h>

using namespace gw::runtime;
using gw::alert::Severity;
using gw::health::ConfigStatus;

namespace {

void fillProcess(gw::health::HealthSnapshot& snap, const std::optional<gw::os::ProcessInfo>& process) {
    snap.process_running = process.has_value();
    if (!process) return;
    snap.pid = process->pid;
    snap.memory_mb = process->memory_mb;
    snap.cpu_percent = process->cpu_percent;
}

}

MonitorLoop::MonitorLoop(const config::Config& cfg, const Clock& clock, Components parts)
    : cfg_(cfg), clock_(clock), parts_(parts) {}

std::chrono::seconds MonitorLoop::runCycle(Context& ctx) {
    ++ctx.cycle;

    health::HealthSnapshot snap;
    snap.taken_at = clock_.now();

    try {
        try {
            parts_.rotator.maybeRotate();
        } catch (const std::exception& e) {
            log::Registry::gatewatch()->warn("[MonitorLoop] Log rotation failed: {}", e.what());
        }

        // Cheap gates first
        snap.disk_percent = parts_.probe.checkDisk(ctx);
        snap.backup_mounted = parts_.probe.checkBackupVolume(ctx);

        if (const auto status = parts_.probe.checkConfig(ctx);
            status == ConfigStatus::Invalid || status == ConfigStatus::Missing) {
            fillProcess(snap, parts_.probe.checkProcess());
            finish(ctx, snap);
            return takeDelay(ctx, cfg_.monitor.check_interval);
        }

        const auto process = parts_.probe.checkProcess();
        fillProcess(snap, process);

        if (!process) {
            log::Registry::gatewatch()->warn("[MonitorLoop] Gateway process not found");
            snap.api_reachable = parts_.probe.checkUpstream();
            if (!snap.api_reachable)
                parts_.alerts.notify(ctx, "network_issue", "Gateway down AND API unreachable", Severity::Critical);

            parts_.recovery.handle(ctx, snap);
            finish(ctx, snap);
            return takeDelay(ctx, cfg_.monitor.check_interval);
        }

        const auto http = parts_.probe.checkHttp(ctx);
        snap.http_healthy = http.healthy;
        snap.http_status = http.status;
        snap.latency = http.latency;

        if (!http.healthy) {
            log::Registry::gatewatch()->warn("[MonitorLoop] Gateway not responding (HTTP {})", http.status);
            snap.api_reachable = parts_.probe.checkUpstream();
            parts_.recovery.handle(ctx, snap);
            finish(ctx, snap);
            return takeDelay(ctx, cfg_.monitor.check_interval);
        }

        observeMemory(ctx, snap);
        snap.recent_errors = parts_.probe.checkErrorDensity(ctx);

        snap.api_reachable = parts_.probe.checkUpstream();
        if (!snap.api_reachable)
            parts_.alerts.notify(ctx, "api_unreachable", "Upstream API unreachable", Severity::Warning);

        if (cfg_.monitor.job_check_every > 0 && ctx.cycle % cfg_.monitor.job_check_every == 0)
            parts_.probe.checkJobs(ctx);

        // The gateway answered 200 this cycle
        ctx.restart.attempts = 0;
        ctx.phase = recovery::Phase::Healthy;
    } catch (const std::exception& e) {
        log::Registry::gatewatch()->critical("[MonitorLoop] Cycle {} aborted: {}", ctx.cycle, e.what());
    }

    finish(ctx, snap);
    return takeDelay(ctx, cfg_.monitor.check_interval);
}

void MonitorLoop::observeMemory(Context& ctx, health::HealthSnapshot& snap) {
    if (!snap.memory_mb) {
        log::Registry::gatewatch()->warn("[MonitorLoop] Could not read gateway memory usage, skipping sample");
        return;
    }

    const auto mb = *snap.memory_mb;
    ctx.last_memory_mb = mb;

    if (const auto leak = parts_.tracker.observe(ctx.memory, mb))
        parts_.alerts.notify(ctx, "memory_leak",
                             fmt::format("Possible memory leak: grew {}MB over the last {} checks",
                                         leak->growth_mb, ctx.memory.size()),
                             Severity::Warning);

    const auto& t = cfg_.thresholds;
    if (mb > t.memory_critical_mb) {
        parts_.alerts.notify(ctx, "memory_critical", fmt::format("Gateway using {}MB RAM", mb), Severity::Critical);

        os::ProcessInfo process;
        process.pid = snap.pid.value_or(0);
        process.memory_mb = mb;
        process.cpu_percent = snap.cpu_percent;
        parts_.recovery.gracefulRestart(ctx, process, fmt::format("Memory critical: {}MB", mb));
    } else if (mb > t.memory_warning_mb) {
        parts_.alerts.notify(ctx, "memory_warning", fmt::format("Gateway using {}MB RAM", mb), Severity::Warning);
    }
}

void MonitorLoop::finish(Context& ctx, const health::HealthSnapshot& snap) const {
    ctx.restart.last_check = snap.taken_at;

    try {
        parts_.publisher.publish(snap);
    } catch (const std::exception& e) {
        log::Registry::gatewatch()->error("[MonitorLoop] Failed to publish metrics: {}", e.what());
    }

    try {
        parts_.store.save(ctx, snap.taken_at);
    } catch (const std::exception& e) {
        log::Registry::gatewatch()->error("[MonitorLoop] Failed to persist state: {}", e.what());
    }

    if (cfg_.monitor.heartbeat_every > 0 && ctx.cycle % cfg_.monitor.heartbeat_every == 0) {
        if (ctx.phase == recovery::Phase::Healthy)
            log::Registry::gatewatch()->info("[MonitorLoop] Heartbeat: All systems healthy");
        else
            log::Registry::gatewatch()->info("[MonitorLoop] Heartbeat: cycle {}, recovery phase {}",
                                             ctx.cycle, recovery::to_string(ctx.phase));
    }
}

std::chrono::seconds MonitorLoop::takeDelay(Context& ctx, const std::chrono::seconds interval) {
    if (!ctx.pause_override) return interval;
    const auto pause = *ctx.pause_override;
    ctx.pause_override.reset();
    return pause;
}
