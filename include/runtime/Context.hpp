#pragma once

#include "alert/Alert.hpp"
#include "health/MemoryTrendTracker.hpp"
#include "recovery/State.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gw::runtime {

// All mutable state that survives from one cycle to the next. Owned by the monitor
// service and handed by reference to each component call; nothing else holds it.
struct Context {
    explicit Context(size_t memoryWindow = 10) : memory(memoryWindow) {}

    std::uint64_t cycle = 0;

    recovery::RestartState restart;
    recovery::Phase phase = recovery::Phase::Healthy;

    health::MemoryWindow memory;
    unsigned long last_memory_mb = 0;

    alert::Ledger alerts;

    // SHA-256 of the gateway config as last seen
    std::optional<std::string> config_hash;

    // Set by the recovery controller when escalation is exhausted; consumed by the next sleep
    std::optional<std::chrono::seconds> pause_override;
};

}
