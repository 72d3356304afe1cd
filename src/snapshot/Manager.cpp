#include "snapshot/Manager.hpp"
#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "log/Registry.hpp"
#include "os/Facade.hpp"
#include "runtime/Context.hpp"
#include "util/files.hpp"
#include "util/hash.hpp"
#include "util/http.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using namespace gw::snapshot;
namespace fs = std::filesystem;

Manager::Manager(const config::Config& cfg, util::HttpClient& http, os::Facade& os,
                 const runtime::Clock& clock, alert::Dispatcher& alerts, const alert::Journal& journal)
    : cfg_(cfg), http_(http), os_(os), clock_(clock), alerts_(alerts), journal_(journal) {}

SnapshotRecord Manager::capture() {
    SnapshotRecord rec;
    rec.at = clock_.now();
    const auto stamp = util::fileStamp(rec.at);

    log::Registry::snapshot()->info("[SnapshotManager] Creating session snapshot before restart");

    try {
        util::ensureDirectory(cfg_.storage.snapshotDir(), fs::perms::owner_all);
    } catch (const std::exception& e) {
        log::Registry::snapshot()->error("[SnapshotManager] Cannot prepare {}: {}", cfg_.storage.snapshotDir().string(), e.what());
        return rec;
    }

    rec.sessions = captureSessions(stamp);
    rec.memory = captureMemory(stamp);

    enforceRetention();
    return rec;
}

std::optional<fs::path> Manager::captureSessions(const std::string& stamp) const {
    const auto url = util::joinUrl(cfg_.gateway.url, cfg_.gateway.sessions_path);
    const auto resp = http_.get(url, cfg_.monitor.snapshot_timeout);

    if (!resp.connected || resp.body.empty()) {
        log::Registry::snapshot()->warn("[SnapshotManager] No session data from {} ({})", url,
                                        resp.error.empty() ? "empty body" : resp.error);
        return std::nullopt;
    }

    const auto sessions = nlohmann::json::parse(resp.body, nullptr, false);
    if (sessions.is_discarded() || sessions.is_null()) {
        log::Registry::snapshot()->warn("[SnapshotManager] Session payload from {} is not usable JSON", url);
        return std::nullopt;
    }

    const auto target = cfg_.storage.snapshotDir() / (std::string(SESSIONS_PREFIX) + stamp + ".json");
    try {
        util::atomicWrite(target, sessions.dump(2), util::OWNER_ONLY);
    } catch (const std::exception& e) {
        log::Registry::snapshot()->error("[SnapshotManager] Failed to write {}: {}", target.string(), e.what());
        return std::nullopt;
    }

    log::Registry::snapshot()->info("[SnapshotManager] Session snapshot saved: {}", target.filename().string());
    return target;
}

std::optional<fs::path> Manager::captureMemory(const std::string& stamp) const {
    const auto& src = cfg_.gateway.memory_dir;
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        log::Registry::snapshot()->debug("[SnapshotManager] No memory workspace at {}", src.string());
        return std::nullopt;
    }

    const auto target = cfg_.storage.snapshotDir() / (std::string(MEMORY_PREFIX) + stamp);
    try {
        util::copyTreeOwnerOnly(src, target);
    } catch (const std::exception& e) {
        log::Registry::snapshot()->error("[SnapshotManager] Failed to copy memory workspace: {}", e.what());
        fs::remove_all(target, ec);
        return std::nullopt;
    }
    return target;
}

std::vector<fs::path> Manager::artifacts(const std::string_view prefix) const {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(cfg_.storage.snapshotDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0) continue;
        if (prefix == SESSIONS_PREFIX && it->path().extension() != ".json") continue;
        out.push_back(it->path());
    }

    // The stamp in the name is fixed width, so name order is creation order
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() > b.filename().string();
    });
    return out;
}

void Manager::enforceRetention() const {
    const auto keep = static_cast<size_t>(cfg_.storage.snapshot_retention);
    for (const auto prefix : {SESSIONS_PREFIX, MEMORY_PREFIX}) {
        const auto list = artifacts(prefix);
        for (size_t i = keep; i < list.size(); ++i) {
            std::error_code ec;
            fs::remove_all(list[i], ec);
            if (ec) log::Registry::snapshot()->warn("[SnapshotManager] Could not prune {}: {}", list[i].string(), ec.message());
            else log::Registry::snapshot()->debug("[SnapshotManager] Pruned {}", list[i].filename().string());
        }
    }
}

std::optional<fs::path> Manager::emergencyBackup() {
    const auto& volume = cfg_.backup.volume;
    if (!os_.isVolumeMounted(volume)) {
        log::Registry::snapshot()->warn("[SnapshotManager] Backup volume {} not mounted, skipping emergency backup", volume.string());
        return std::nullopt;
    }

    const auto target = cfg_.backup.emergencyRoot() / ("emergency-" + util::fileStamp(clock_.now()));
    log::Registry::snapshot()->info("[SnapshotManager] Creating emergency backup at {}", target.string());

    try {
        util::ensureDirectory(target.parent_path(), fs::perms::owner_all);
        util::copyTreeOwnerOnly(cfg_.gateway.workspace_dir, target);
    } catch (const std::exception& e) {
        log::Registry::snapshot()->error("[SnapshotManager] Emergency backup failed: {}", e.what());
        return std::nullopt;
    }

    journal_.append("💾 Emergency backup created");
    return target;
}

std::vector<fs::path> Manager::configBackupsNewestFirst() const {
    std::vector<std::pair<fs::file_time_type, fs::path>> found;
    std::error_code ec;
    for (fs::directory_iterator it(cfg_.backup.configBackupDir(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind(cfg_.backup.config_glob_prefix, 0) != 0 || it->path().extension() != ".json") continue;
        if (!it->is_regular_file(ec)) continue;
        const auto mtime = fs::last_write_time(it->path(), ec);
        if (ec) continue;
        found.emplace_back(mtime, it->path());
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<fs::path> out;
    out.reserve(found.size());
    for (auto& [_, p] : found) out.push_back(std::move(p));
    return out;
}

bool Manager::restoreConfigFromBackup(runtime::Context& ctx) {
    const auto& live = cfg_.gateway.config_file;

    for (const auto& candidate : configBackupsNewestFirst()) {
        if (!os_.ownedByCurrentUser(candidate)) {
            log::Registry::snapshot()->error("[SnapshotManager] SECURITY: ownership mismatch on backup {}", candidate.string());
            alerts_.notify(ctx, "security_ownership", "Untrusted config backup ignored: " + candidate.filename().string(),
                           alert::Severity::Critical);
            continue;
        }

        try {
            if (nlohmann::json::parse(util::readFileToString(candidate), nullptr, false).is_discarded()) {
                log::Registry::snapshot()->warn("[SnapshotManager] Backup {} is not valid JSON, skipping", candidate.string());
                continue;
            }

            fs::copy_file(candidate, live, fs::copy_options::overwrite_existing);
            fs::permissions(live, util::OWNER_ONLY, fs::perm_options::replace);
        } catch (const std::exception& e) {
            log::Registry::snapshot()->error("[SnapshotManager] Restore from {} failed: {}", candidate.string(), e.what());
            continue;
        }

        ctx.config_hash = util::sha256File(live);
        log::Registry::snapshot()->info("[SnapshotManager] Restored config from {}", candidate.string());
        alerts_.notify(ctx, "config_restored", "Config restored from backup", alert::Severity::Warning);
        return true;
    }

    log::Registry::snapshot()->error("[SnapshotManager] No valid config backup found in {}", cfg_.backup.configBackupDir().string());
    alerts_.notify(ctx, "config_no_backup", "Config invalid and NO BACKUP FOUND!", alert::Severity::Critical);
    return false;
}
