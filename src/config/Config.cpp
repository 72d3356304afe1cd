#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace gw::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["gateway"]) YAML::convert<GatewayConfig>::decode(node, cfg.gateway);
    if (auto node = root["upstream"]) YAML::convert<UpstreamConfig>::decode(node, cfg.upstream);
    if (auto node = root["monitor"]) YAML::convert<MonitorConfig>::decode(node, cfg.monitor);
    if (auto node = root["thresholds"]) YAML::convert<ThresholdsConfig>::decode(node, cfg.thresholds);
    if (auto node = root["recovery"]) YAML::convert<RecoveryConfig>::decode(node, cfg.recovery);
    if (auto node = root["alerts"]) YAML::convert<AlertsConfig>::decode(node, cfg.alerts);
    if (auto node = root["backup"]) YAML::convert<BackupConfig>::decode(node, cfg.backup);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void validate(const Config& cfg) {
    const auto& t = cfg.thresholds;
    if (t.latency_warning >= t.latency_critical)
        throw std::invalid_argument("thresholds.latency_warning_ms must be below latency_critical_ms");
    if (t.memory_warning_mb >= t.memory_critical_mb)
        throw std::invalid_argument("thresholds.memory_warning_mb must be below memory_critical_mb");
    if (t.disk_warning_percent >= t.disk_critical_percent || t.disk_critical_percent > 100)
        throw std::invalid_argument("thresholds.disk_* percentages are inconsistent");
    if (t.leak_window < 2) throw std::invalid_argument("thresholds.leak_window must be at least 2");
    if (cfg.recovery.max_attempts == 0) throw std::invalid_argument("recovery.max_attempts must be at least 1");
    if (cfg.monitor.check_interval.count() <= 0) throw std::invalid_argument("monitor.check_interval must be positive");
    if (cfg.monitor.heartbeat_every == 0 || cfg.monitor.job_check_every == 0)
        throw std::invalid_argument("monitor cycle periods must be at least 1");
    if (cfg.storage.snapshot_retention == 0) throw std::invalid_argument("storage.snapshot_retention must be at least 1");
    if (cfg.logging.keep == 0) throw std::invalid_argument("logging.keep must be at least 1");
    if (cfg.alerts.remote.enabled && cfg.alerts.remote.workers == 0)
        throw std::invalid_argument("alerts.remote.workers must be at least 1");
}

}

void Config::resolvePaths() {
    gateway.config_file = expandHome(gateway.config_file);
    gateway.error_log = expandHome(gateway.error_log);
    gateway.workspace_dir = expandHome(gateway.workspace_dir);
    gateway.memory_dir = expandHome(gateway.memory_dir);
    backup.volume = expandHome(backup.volume);
    storage.data_dir = expandHome(storage.data_dir);
}

std::filesystem::path defaultConfigPath() {
    return expandHome("~/.gatewatch/config.yaml");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    // An absent file means "all defaults"
    if (std::filesystem::exists(path)) {
        try {
            cfg = decodeRoot(YAML::LoadFile(path.string()));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
        }
    }

    cfg.resolvePaths();
    validate(cfg);
    return cfg;
}

Config loadConfigFromString(const std::string& yaml) {
    Config cfg;
    try {
        cfg = decodeRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
    cfg.resolvePaths();
    validate(cfg);
    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"gateway", c.gateway},
        {"upstream", {{"url", c.upstream.url}}},
        {"monitor", c.monitor},
        {"thresholds", c.thresholds},
        {"recovery", c.recovery},
        {"alerts", c.alerts},
        {"backup", c.backup},
        {"storage", c.storage},
        {"logging", {
            {"max_size", bytesToMbOrGbStr(c.logging.max_size_bytes)},
            {"keep", c.logging.keep}
        }}
    };
}

void to_json(nlohmann::json& j, const GatewayConfig& c) {
    j = {
        {"process_pattern", c.process_pattern},
        {"url", c.url},
        {"service_id", c.service_id},
        {"restart_command", c.restart_command},
        {"graceful_signal", c.graceful_signal},
        {"config_file", c.config_file.string()},
        {"error_log", c.error_log.string()},
        {"workspace_dir", c.workspace_dir.string()},
        {"memory_dir", c.memory_dir.string()}
    };
}

void to_json(nlohmann::json& j, const MonitorConfig& c) {
    j = {
        {"check_interval", durationToString(c.check_interval)},
        {"heartbeat_every", c.heartbeat_every},
        {"job_check_every", c.job_check_every},
        {"http_timeout", durationToString(c.http_timeout)},
        {"snapshot_timeout", durationToString(c.snapshot_timeout)},
        {"command_timeout", durationToString(c.command_timeout)}
    };
}

void to_json(nlohmann::json& j, const ThresholdsConfig& c) {
    j = {
        {"latency_warning_ms", c.latency_warning.count()},
        {"latency_critical_ms", c.latency_critical.count()},
        {"memory_warning_mb", c.memory_warning_mb},
        {"memory_critical_mb", c.memory_critical_mb},
        {"leak_growth_mb", c.leak_growth_mb},
        {"leak_window", c.leak_window},
        {"disk_warning_percent", c.disk_warning_percent},
        {"disk_critical_percent", c.disk_critical_percent},
        {"error_count", c.error_count},
        {"error_tail_lines", c.error_tail_lines},
        {"error_log_max_age", durationToString(c.error_log_max_age)}
    };
}

void to_json(nlohmann::json& j, const RecoveryConfig& c) {
    j = {
        {"max_attempts", c.max_attempts},
        {"graceful_settle", durationToString(c.graceful_settle)},
        {"hard_settle", durationToString(c.hard_settle)}
    };
}

void to_json(nlohmann::json& j, const AlertsConfig& c) {
    j = {
        {"cooldown", durationToString(c.cooldown)},
        {"desktop", {{"enabled", c.desktop.enabled}, {"command", c.desktop.command}}},
        {"remote", {
            {"enabled", c.remote.enabled},
            {"timeout", durationToString(c.remote.timeout)},
            {"workers", c.remote.workers},
            {"queue_limit", c.remote.queue_limit}
        }}
    };
}

void to_json(nlohmann::json& j, const BackupConfig& c) {
    j = {
        {"volume", c.volume.string()},
        {"config_dir", c.config_dir.string()},
        {"emergency_dir", c.emergency_dir.string()}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"data_dir", c.data_dir.string()},
        {"snapshot_retention", c.snapshot_retention}
    };
}

} // namespace gw::config
