#pragma once

#include "runtime/Clock.hpp"

#include <optional>
#include <string_view>

namespace gw::recovery {

enum class Phase { Healthy, Degraded, GracefulRestartAttempted, HardRestartAttempted, Exhausted };

constexpr std::string_view to_string(const Phase p) {
    switch (p) {
        case Phase::Healthy: return "healthy";
        case Phase::Degraded: return "degraded";
        case Phase::GracefulRestartAttempted: return "graceful_restart_attempted";
        case Phase::HardRestartAttempted: return "hard_restart_attempted";
        case Phase::Exhausted: return "exhausted";
    }
    return "unknown";
}

// Attempts since the last confirmed recovery. Only the Controller writes it.
struct RestartState {
    unsigned int attempts = 0;
    std::optional<runtime::TimePoint> last_check;
};

}
