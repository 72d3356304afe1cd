#pragma once

#include "runtime/Clock.hpp"

#include <chrono>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace gw::health {

// One cycle's readings. Assembled during the cycle, then handed on as const.
struct HealthSnapshot {
    runtime::TimePoint taken_at;

    bool process_running = false;
    std::optional<int> pid;
    std::optional<unsigned long> memory_mb;
    double cpu_percent = 0.0;

    bool http_healthy = false;
    long http_status = 0;
    std::chrono::milliseconds latency{0};

    std::optional<unsigned int> disk_percent;
    bool backup_mounted = false;
    bool api_reachable = false;
    unsigned int recent_errors = 0;
};

// Metrics file layout read by the status client
void to_json(nlohmann::json& j, const HealthSnapshot& s);

}
