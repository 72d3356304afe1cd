#pragma once

#include "config/Config.hpp"
#include "os/Facade.hpp"
#include "recovery/State.hpp"
#include "runtime/Clock.hpp"

#include <optional>
#include <string_view>

namespace gw::health { class Probe; struct HealthSnapshot; }
namespace gw::snapshot { class Manager; }
namespace gw::alert { class Dispatcher; class Journal; }
namespace gw::runtime { struct Context; }

namespace gw::recovery {

// Escalation ladder: graceful signal, then supervisor restart, then give up and pause.
class Controller {
public:
    Controller(const config::Config& cfg, os::Facade& os, health::Probe& probe, snapshot::Manager& snapshots,
               alert::Dispatcher& alerts, const alert::Journal& journal, runtime::Clock& clock);

    // Entry point for a degraded cycle (process absent or HTTP unhealthy). Returns the phase reached.
    Phase handle(runtime::Context& ctx, const health::HealthSnapshot& snapshot);

    // Snapshot, signal, settle, re-probe. true if the gateway answered healthy afterwards.
    bool gracefulRestart(runtime::Context& ctx, const os::ProcessInfo& process, std::string_view reason);

    // Snapshot, emergency backup, supervisor restart, settle, re-probe. Bumps the attempt counter on failure.
    bool hardRestart(runtime::Context& ctx);

    void exhaust(runtime::Context& ctx, bool processPresent);

private:
    const config::Config& cfg_;
    os::Facade& os_;
    health::Probe& probe_;
    snapshot::Manager& snapshots_;
    alert::Dispatcher& alerts_;
    const alert::Journal& journal_;
    runtime::Clock& clock_;

    // Set when a settle wait was cut short by shutdown
    bool interrupted_ = false;

    [[nodiscard]] bool ceilingReached(const runtime::Context& ctx) const;
    void recovered(runtime::Context& ctx) const;
    bool settle(std::chrono::seconds d);
};

}
