#include "state/Store.hpp"
#include "log/Registry.hpp"
#include "os/Facade.hpp"
#include "runtime/Context.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace gw::state {

PersistedState PersistedState::fromContext(const runtime::Context& ctx, const runtime::TimePoint now) {
    PersistedState s;
    s.restart_attempts = ctx.restart.attempts;
    s.last_check = util::toEpochSeconds(ctx.restart.last_check.value_or(now));
    s.memory_history = ctx.memory.values();
    s.last_memory_mb = s.memory_history.empty() ? ctx.last_memory_mb : s.memory_history.back();
    s.config_hash = ctx.config_hash.value_or("");
    return s;
}

void PersistedState::applyTo(runtime::Context& ctx) const {
    ctx.restart.attempts = restart_attempts;
    if (last_check) ctx.restart.last_check = util::fromEpochSeconds(*last_check);
    ctx.memory.assign(memory_history);
    ctx.last_memory_mb = last_memory_mb;
    if (!config_hash.empty()) ctx.config_hash = config_hash;
}

void to_json(nlohmann::json& j, const PersistedState& s) {
    j = {
        {"restart_attempts", s.restart_attempts},
        {"last_check", s.last_check ? nlohmann::json(*s.last_check) : nlohmann::json(nullptr)},
        {"last_memory_mb", s.last_memory_mb},
        {"memory_history", s.memory_history},
        {"config_hash", s.config_hash}
    };
}

void from_json(const nlohmann::json& j, PersistedState& s) {
    s.restart_attempts = j.value("restart_attempts", 0u);
    if (j.contains("last_check") && j.at("last_check").is_number_integer())
        s.last_check = j.at("last_check").get<long long>();
    s.last_memory_mb = j.value("last_memory_mb", 0ul);
    s.memory_history = j.value("memory_history", std::vector<unsigned long>{});
    s.config_hash = j.value("config_hash", std::string{});
}

Store::Store(std::filesystem::path file, const os::Facade& os)
    : file_(std::move(file)), os_(os) {}

LoadResult Store::load() const {
    LoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        log::Registry::state()->info("[StateStore] No state at {}, starting fresh", file_.string());
        return result;
    }

    if (!os_.ownedByCurrentUser(file_)) {
        log::Registry::state()->error("[StateStore] SECURITY: ownership mismatch on {}, ignoring it", file_.string());
        result.status = LoadStatus::Untrusted;
        return result;
    }

    try {
        result.state = nlohmann::json::parse(util::readFileToString(file_)).get<PersistedState>();
        result.status = LoadStatus::Loaded;
        log::Registry::state()->info("[StateStore] Resumed with {} restart attempt(s), {} memory sample(s)",
                                     result.state.restart_attempts, result.state.memory_history.size());
    } catch (const std::exception& e) {
        log::Registry::state()->warn("[StateStore] Unreadable state in {}: {}", file_.string(), e.what());
        result.state = {};
        result.status = LoadStatus::Corrupt;
    }

    return result;
}

void Store::save(const runtime::Context& ctx, const runtime::TimePoint now) const {
    const nlohmann::json j = PersistedState::fromContext(ctx, now);
    util::atomicWrite(file_, j.dump(4), util::OWNER_ONLY);
    log::Registry::state()->debug("[StateStore] Saved state to {}", file_.string());
}

}
