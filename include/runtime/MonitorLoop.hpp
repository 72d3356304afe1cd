#pragma once

#include "config/Config.hpp"
#include "runtime/Clock.hpp"

#include <chrono>

namespace gw::health { class Probe; class MemoryTrendTracker; struct HealthSnapshot; }
namespace gw::recovery { class Controller; }
namespace gw::alert { class Dispatcher; }
namespace gw::state { class Store; }
namespace gw::metrics { class Publisher; }
namespace gw::log { class Rotator; }

namespace gw::runtime {

struct Context;

class MonitorLoop {
public:
    struct Components {
        health::Probe& probe;
        health::MemoryTrendTracker& tracker;
        recovery::Controller& recovery;
        alert::Dispatcher& alerts;
        state::Store& store;
        metrics::Publisher& publisher;
        const log::Rotator& rotator;
    };

    MonitorLoop(const config::Config& cfg, const Clock& clock, Components parts);

    // One full pass. Returns how long to wait before the next one.
    std::chrono::seconds runCycle(Context& ctx);

private:
    const config::Config& cfg_;
    const Clock& clock_;
    Components parts_;

    void observeMemory(Context& ctx, health::HealthSnapshot& snap);
    void finish(Context& ctx, const health::HealthSnapshot& snap) const;
    static std::chrono::seconds takeDelay(Context& ctx, std::chrono::seconds interval);
};

}
