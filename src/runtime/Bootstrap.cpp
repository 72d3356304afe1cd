#include "runtime/Bootstrap.hpp"
#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "log/Registry.hpp"
#include "os/Facade.hpp"
#include "runtime/Context.hpp"
#include "state/Store.hpp"
#include "util/files.hpp"

#include <unistd.h>

using namespace gw::runtime;
namespace fs = std::filesystem;

Bootstrap::Bootstrap(const config::Config& cfg, Components parts)
    : cfg_(cfg), parts_(parts) {}

bool Bootstrap::prepareDirectories(Context& ctx) {
    try {
        util::ensureDirectory(cfg_.storage.data_dir, fs::perms::owner_all);
        util::ensureDirectory(cfg_.storage.snapshotDir(), fs::perms::owner_all);
        return true;
    } catch (const fs::filesystem_error& e) {
        log::Registry::gatewatch()->critical("[Bootstrap] Cannot prepare storage under {}: {}",
                                             cfg_.storage.data_dir.string(), e.what());
        parts_.alerts.notify(ctx, "storage_unavailable",
                             "Cannot prepare watchdog storage: " + e.path1().string(),
                             alert::Severity::Critical);
        return false;
    }
}

void Bootstrap::verifyOwnership(Context& ctx, const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec) || parts_.os.ownedByCurrentUser(file)) return;

    log::Registry::gatewatch()->critical("[Bootstrap] SECURITY: File ownership mismatch: {}", file.string());
    parts_.alerts.notify(ctx, "security_ownership", "File ownership mismatch: " + file.filename().string(),
                         alert::Severity::Critical);
}

void Bootstrap::run(Context& ctx) {
    const bool storageReady = prepareDirectories(ctx);

    log::Registry::gatewatch()->info("[Bootstrap] =========================================");
    log::Registry::gatewatch()->info("[Bootstrap] Gateway watchdog started");
    log::Registry::gatewatch()->info("[Bootstrap] Gateway: {}", cfg_.gateway.url);
    log::Registry::gatewatch()->info("[Bootstrap] PID: {}", ::getpid());
    log::Registry::gatewatch()->info("[Bootstrap] UID: {}", parts_.os.currentUid());
    log::Registry::gatewatch()->info("[Bootstrap] =========================================");

    verifyOwnership(ctx, cfg_.gateway.config_file);
    verifyOwnership(ctx, parts_.store.file());

    // A foreign-owned state file comes back Untrusted and is ignored; the first save replaces it
    if (storageReady) {
        const auto loaded = parts_.store.load();
        if (loaded.status == state::LoadStatus::Loaded) loaded.state.applyTo(ctx);
    }

    parts_.alerts.notify(ctx, "startup", "Watchdog started", alert::Severity::Info);
    parts_.journal.append("🐕 Watchdog started");
}
