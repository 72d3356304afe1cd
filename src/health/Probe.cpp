#include "health/Probe.hpp"
#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "log/Registry.hpp"
#include "runtime/Context.hpp"
#include "snapshot/Manager.hpp"
#include "util/files.hpp"
#include "util/hash.hpp"
#include "util/http.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <sys/stat.h>

using namespace gw::health;
using gw::alert::Severity;
namespace fs = std::filesystem;

Probe::Probe(const config::Config& cfg, os::Facade& os, util::HttpClient& http, const runtime::Clock& clock,
             alert::Dispatcher& alerts, snapshot::Manager& snapshots, const alert::Journal& journal)
    : cfg_(cfg), os_(os), http_(http), clock_(clock), alerts_(alerts), snapshots_(snapshots), journal_(journal) {}

std::optional<unsigned int> Probe::checkDisk(runtime::Context& ctx) {
    const auto usage = os_.diskUsagePercent("/");
    if (!usage) return std::nullopt;

    // df rounds up
    const auto percent = static_cast<unsigned int>(std::ceil(*usage));
    const auto& t = cfg_.thresholds;

    if (percent > t.disk_critical_percent)
        alerts_.notify(ctx, "disk_critical", fmt::format("Disk {}% full", percent), Severity::Critical);
    else if (percent > t.disk_warning_percent)
        alerts_.notify(ctx, "disk_warning", fmt::format("Disk {}% full", percent), Severity::Warning);

    return percent;
}

bool Probe::checkBackupVolume(runtime::Context& ctx) {
    const auto& volume = cfg_.backup.volume;
    if (os_.isVolumeMounted(volume)) return true;

    alerts_.notify(ctx, "backup_drive", fmt::format("Backup drive {} is NOT mounted!", volume.string()), Severity::Critical);
    return false;
}

ConfigStatus Probe::checkConfig(runtime::Context& ctx) {
    const auto& file = cfg_.gateway.config_file;

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        log::Registry::probe()->critical("[HealthProbe] Config file missing: {}", file.string());
        alerts_.notify(ctx, "config_missing", "Config file missing!", Severity::Critical);
        snapshots_.restoreConfigFromBackup(ctx);
        return ConfigStatus::Missing;
    }

    std::string content;
    try {
        content = util::readFileToString(file);
        (void) nlohmann::json::parse(content);
    } catch (const std::exception& e) {
        log::Registry::probe()->critical("[HealthProbe] Config {} is not valid JSON: {}", file.string(), e.what());
        alerts_.notify(ctx, "config_invalid", "Config file is invalid JSON!", Severity::Critical);
        snapshots_.restoreConfigFromBackup(ctx);
        return ConfigStatus::Invalid;
    }

    const auto hash = util::sha256Hex(content);
    const bool changed = ctx.config_hash && !ctx.config_hash->empty() && *ctx.config_hash != hash;
    ctx.config_hash = hash;

    if (!changed) return ConfigStatus::Valid;

    // A valid edit made outside the watchdog is reported, never reverted
    log::Registry::probe()->warn("[HealthProbe] Config file changed: {}", file.string());
    alerts_.notify(ctx, "config_changed", "Config file changed unexpectedly", Severity::Warning);
    journal_.append("⚙️ Config file changed");
    return ConfigStatus::Changed;
}

std::optional<gw::os::ProcessInfo> Probe::checkProcess() {
    try {
        return os_.findProcess(cfg_.gateway.process_pattern);
    } catch (const std::exception& e) {
        log::Registry::probe()->error("[HealthProbe] Process lookup failed: {}", e.what());
        return std::nullopt;
    }
}

HttpCheck Probe::checkHttp(runtime::Context& ctx) {
    const auto url = util::joinUrl(cfg_.gateway.url, "/");
    const auto resp = http_.get(url, cfg_.monitor.http_timeout);

    HttpCheck check;
    check.status = resp.status;
    check.latency = resp.elapsed;
    check.healthy = resp.connected && resp.status == 200;

    recordLatency(check.latency);

    const auto& t = cfg_.thresholds;
    const auto ms = check.latency.count();
    if (check.latency > t.latency_critical)
        alerts_.notify(ctx, "response_slow", fmt::format("Gateway response time critical: {}ms", ms), Severity::Critical);
    else if (check.latency > t.latency_warning)
        alerts_.notify(ctx, "response_slow", fmt::format("Gateway response time slow: {}ms", ms), Severity::Warning);

    if (!check.healthy)
        log::Registry::probe()->warn("[HealthProbe] {} answered {} after {}ms{}", url, resp.status, ms,
                                     resp.error.empty() ? "" : " (" + resp.error + ")");
    else
        log::Registry::probe()->debug("[HealthProbe] {} healthy in {}ms", url, ms);

    return check;
}

void Probe::recordLatency(const std::chrono::milliseconds latency) const {
    try {
        util::atomicWrite(cfg_.storage.responseTimeFile(), std::to_string(latency.count()) + "\n", util::WORLD_READABLE);
    } catch (const std::exception& e) {
        log::Registry::probe()->warn("[HealthProbe] Could not record response time: {}", e.what());
    }
}

bool Probe::checkUpstream() {
    const auto resp = http_.get(cfg_.upstream.url, cfg_.monitor.http_timeout);
    if (!resp.connected)
        log::Registry::probe()->warn("[HealthProbe] Upstream {} unreachable: {}", cfg_.upstream.url, resp.error);
    return resp.connected;
}

bool Probe::isErrorLine(const std::string& line) {
    std::string lower(line.size(), '\0');
    std::transform(line.begin(), line.end(), lower.begin(), [](const unsigned char c) { return std::tolower(c); });
    return lower.find("error") != std::string::npos ||
           lower.find("exception") != std::string::npos ||
           lower.find("fatal") != std::string::npos;
}

unsigned int Probe::checkErrorDensity(runtime::Context& ctx) {
    const auto& logFile = cfg_.gateway.error_log;

    struct stat st{};
    if (::stat(logFile.c_str(), &st) != 0) return 0;

    const auto modified = std::chrono::system_clock::from_time_t(st.st_mtime);
    if (clock_.now() - modified >= cfg_.thresholds.error_log_max_age) return 0;

    unsigned int count = 0;
    try {
        for (const auto& line : util::tailLines(logFile, cfg_.thresholds.error_tail_lines))
            if (isErrorLine(line)) ++count;
    } catch (const std::exception& e) {
        log::Registry::probe()->warn("[HealthProbe] Cannot read {}: {}", logFile.string(), e.what());
        return 0;
    }

    if (count > cfg_.thresholds.error_count)
        alerts_.notify(ctx, "error_rate", fmt::format("High error rate: {} errors in recent log", count), Severity::Warning);

    return count;
}

std::vector<std::string> Probe::checkJobs(runtime::Context& ctx) {
    std::vector<std::string> failed;

    const auto url = util::joinUrl(cfg_.gateway.url, cfg_.gateway.jobs_path);
    const auto resp = http_.get(url, cfg_.monitor.snapshot_timeout);
    if (!resp.connected || resp.body.empty()) {
        log::Registry::probe()->debug("[HealthProbe] No job status from {}", url);
        return failed;
    }

    try {
        const auto j = nlohmann::json::parse(resp.body);
        if (!j.contains("jobs") || !j.at("jobs").is_array()) return failed;

        for (const auto& job : j.at("jobs")) {
            if (!job.is_object() || !job.contains("lastRun") || !job.at("lastRun").is_object()) continue;
            if (job.at("lastRun").value("status", std::string{}) != "failed") continue;
            failed.push_back(job.value("name", std::string{"unnamed"}));
        }
    } catch (const nlohmann::json::exception& e) {
        log::Registry::probe()->warn("[HealthProbe] Malformed job status from {}: {}", url, e.what());
        return failed;
    }

    if (!failed.empty())
        alerts_.notify(ctx, "cron_failed", fmt::format("Cron job(s) failed: {}", fmt::join(failed, ", ")), Severity::Warning);

    return failed;
}
