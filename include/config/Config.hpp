#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace gw::config {

constexpr static uintmax_t DEFAULT_LOG_MAX_BYTES = 10 * 1024 * 1024; // 10MB

struct GatewayConfig {
    std::string process_pattern = "openclaw-gateway";
    std::string url = "http://127.0.0.1:18789";
    std::string service_id = "openclaw-gateway.service";
    std::vector<std::string> restart_command = {"systemctl", "--user", "restart", "{service}"};
    std::string graceful_signal = "SIGUSR1";
    std::filesystem::path config_file = "~/.openclaw/openclaw.json";
    std::filesystem::path error_log = "/tmp/openclaw/openclaw-stderr.log";
    std::filesystem::path workspace_dir = "~/.openclaw";
    std::filesystem::path memory_dir = "~/.openclaw/workspace/memory";
    std::string sessions_path = "/api/sessions";
    std::string jobs_path = "/api/cron/status";
};

struct UpstreamConfig {
    std::string url = "https://api.anthropic.com";
};

struct MonitorConfig {
    std::chrono::seconds check_interval{60};
    unsigned int heartbeat_every = 10;
    unsigned int job_check_every = 10;
    std::chrono::seconds http_timeout{10};
    std::chrono::seconds snapshot_timeout{5};
    std::chrono::seconds command_timeout{10};
};

struct ThresholdsConfig {
    std::chrono::milliseconds latency_warning{5000};
    std::chrono::milliseconds latency_critical{10000};
    unsigned int memory_warning_mb = 500;
    unsigned int memory_critical_mb = 800;
    unsigned int leak_growth_mb = 50;
    unsigned int leak_window = 10;
    unsigned int disk_warning_percent = 80;
    unsigned int disk_critical_percent = 90;
    unsigned int error_count = 10;
    unsigned int error_tail_lines = 100;
    std::chrono::seconds error_log_max_age{300};
};

struct RecoveryConfig {
    unsigned int max_attempts = 3;
    std::chrono::seconds graceful_settle{5};
    std::chrono::seconds hard_settle{10};
};

struct DesktopAlertConfig {
    bool enabled = true;
    std::string command = "notify-send";
    std::string sound_warning = "dialog-warning";
    std::string sound_critical = "dialog-error";
};

struct RemoteAlertConfig {
    bool enabled = false;
    std::vector<std::string> command = {
        "openclaw", "message", "send", "--channel", "slack", "--message", "{message}", "--best-effort"
    };
    std::chrono::seconds timeout{10};
    unsigned int workers = 1;
    unsigned int queue_limit = 32;
};

struct AlertsConfig {
    std::chrono::seconds cooldown{1800};
    DesktopAlertConfig desktop;
    RemoteAlertConfig remote;
};

struct BackupConfig {
    std::filesystem::path volume = "/mnt/backup";
    std::filesystem::path config_dir = "openclaw_backup/configs";
    std::string config_glob_prefix = "openclaw-";
    std::filesystem::path emergency_dir = "openclaw_backup";

    [[nodiscard]] std::filesystem::path configBackupDir() const { return volume / config_dir; }
    [[nodiscard]] std::filesystem::path emergencyRoot() const { return volume / emergency_dir; }
};

struct StorageConfig {
    std::filesystem::path data_dir = "~/.gatewatch";
    unsigned int snapshot_retention = 10;

    [[nodiscard]] std::filesystem::path logFile() const { return data_dir / "watchdog.log"; }
    [[nodiscard]] std::filesystem::path metricsFile() const { return data_dir / "metrics.json"; }
    [[nodiscard]] std::filesystem::path stateFile() const { return data_dir / "state.json"; }
    [[nodiscard]] std::filesystem::path responseTimeFile() const { return data_dir / "last_response_time"; }
    [[nodiscard]] std::filesystem::path snapshotDir() const { return data_dir / "snapshots"; }
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gatewatch = spdlog::level::info;  // Lifecycle, heartbeat
    spdlog::level::level_enum probe     = spdlog::level::info;
    spdlog::level::level_enum alert     = spdlog::level::info;  // ALERT lines must always reach the file
    spdlog::level::level_enum recovery  = spdlog::level::info;
    spdlog::level::level_enum snapshot  = spdlog::level::info;
    spdlog::level::level_enum state     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    uintmax_t max_size_bytes = DEFAULT_LOG_MAX_BYTES;
    unsigned int keep = 5;
    LogLevelsConfig levels;
};

struct Config {
    GatewayConfig gateway;
    UpstreamConfig upstream;
    MonitorConfig monitor;
    ThresholdsConfig thresholds;
    RecoveryConfig recovery;
    AlertsConfig alerts;
    BackupConfig backup;
    StorageConfig storage;
    LoggingConfig logging;

    // Expands a leading '~' in every path field.
    void resolvePaths();
};

std::filesystem::path defaultConfigPath();

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const GatewayConfig& c);
void to_json(nlohmann::json& j, const MonitorConfig& c);
void to_json(nlohmann::json& j, const ThresholdsConfig& c);
void to_json(nlohmann::json& j, const RecoveryConfig& c);
void to_json(nlohmann::json& j, const AlertsConfig& c);
void to_json(nlohmann::json& j, const BackupConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);

} // namespace gw::config
