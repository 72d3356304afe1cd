#include "health/Snapshot.hpp"
#include "util/timestamp.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

void gw::health::to_json(nlohmann::json& j, const HealthSnapshot& s) {
    j = {
        {"timestamp", util::toEpochSeconds(s.taken_at)},
        {"datetime", util::dateTimeString(s.taken_at)},
        {"gateway", {
            {"pid", s.pid ? nlohmann::json(*s.pid) : nlohmann::json(nullptr)},
            {"memory_mb", s.memory_mb ? nlohmann::json(*s.memory_mb) : nlohmann::json(nullptr)},
            {"cpu_percent", std::round(s.cpu_percent * 10.0) / 10.0}
        }},
        {"system", {
            {"disk_percent", s.disk_percent.value_or(0)},
            {"backup_drive_mounted", s.backup_mounted}
        }},
        {"health", {
            {"gateway_running", s.process_running},
            {"gateway_healthy", s.http_healthy},
            {"api_reachable", s.api_reachable}
        }}
    };
}
