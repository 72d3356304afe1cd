#pragma once

#include "runtime/Clock.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace gw::alert {

enum class Severity { Info, Success, Warning, Critical };

constexpr std::string_view to_string(const Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Success: return "success";
        case Severity::Warning: return "warning";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

// What the sinks receive, already sanitized.
struct Notification {
    std::string type;
    std::string message;
    Severity severity = Severity::Warning;
    runtime::TimePoint at;
};

// Alert type -> last time it actually fired
using Ledger = std::unordered_map<std::string, runtime::TimePoint>;

}
