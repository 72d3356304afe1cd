#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gw::config;

namespace detail_gw {

inline std::chrono::seconds durationOr(const Node& node, const std::chrono::seconds def) {
    if (!node) return def;
    return parseDuration(node.as<std::string>());
}

inline std::vector<std::string> argvOr(const Node& node, const std::vector<std::string>& def) {
    if (!node) return def;
    if (!node.IsSequence()) throw ParserException(node.Mark(), "expected a list of command arguments");
    auto argv = node.as<std::vector<std::string>>();
    if (argv.empty()) throw ParserException(node.Mark(), "command must not be empty");
    return argv;
}

inline spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

}

template<>
struct convert<GatewayConfig> {
    static bool decode(const Node& node, GatewayConfig& rhs) {
        if (!node.IsMap()) return false;
        const GatewayConfig def;
        rhs.process_pattern = node["process_pattern"].as<std::string>(def.process_pattern);
        rhs.url = node["url"].as<std::string>(def.url);
        rhs.service_id = node["service_id"].as<std::string>(def.service_id);
        rhs.restart_command = detail_gw::argvOr(node["restart_command"], def.restart_command);
        rhs.graceful_signal = node["graceful_signal"].as<std::string>(def.graceful_signal);
        rhs.config_file = node["config_file"].as<std::string>(def.config_file.string());
        rhs.error_log = node["error_log"].as<std::string>(def.error_log.string());
        rhs.workspace_dir = node["workspace_dir"].as<std::string>(def.workspace_dir.string());
        rhs.memory_dir = node["memory_dir"].as<std::string>(def.memory_dir.string());
        rhs.sessions_path = node["sessions_path"].as<std::string>(def.sessions_path);
        rhs.jobs_path = node["jobs_path"].as<std::string>(def.jobs_path);
        return true;
    }
};

template<>
struct convert<UpstreamConfig> {
    static bool decode(const Node& node, UpstreamConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>(UpstreamConfig{}.url);
        return true;
    }
};

template<>
struct convert<MonitorConfig> {
    static bool decode(const Node& node, MonitorConfig& rhs) {
        if (!node.IsMap()) return false;
        const MonitorConfig def;
        rhs.check_interval = detail_gw::durationOr(node["check_interval"], def.check_interval);
        rhs.heartbeat_every = node["heartbeat_every"].as<unsigned int>(def.heartbeat_every);
        rhs.job_check_every = node["job_check_every"].as<unsigned int>(def.job_check_every);
        rhs.http_timeout = detail_gw::durationOr(node["http_timeout"], def.http_timeout);
        rhs.snapshot_timeout = detail_gw::durationOr(node["snapshot_timeout"], def.snapshot_timeout);
        rhs.command_timeout = detail_gw::durationOr(node["command_timeout"], def.command_timeout);
        return true;
    }
};

template<>
struct convert<ThresholdsConfig> {
    static bool decode(const Node& node, ThresholdsConfig& rhs) {
        if (!node.IsMap()) return false;
        const ThresholdsConfig def;
        rhs.latency_warning = std::chrono::milliseconds(
            node["latency_warning_ms"].as<long long>(def.latency_warning.count()));
        rhs.latency_critical = std::chrono::milliseconds(
            node["latency_critical_ms"].as<long long>(def.latency_critical.count()));
        rhs.memory_warning_mb = node["memory_warning_mb"].as<unsigned int>(def.memory_warning_mb);
        rhs.memory_critical_mb = node["memory_critical_mb"].as<unsigned int>(def.memory_critical_mb);
        rhs.leak_growth_mb = node["leak_growth_mb"].as<unsigned int>(def.leak_growth_mb);
        rhs.leak_window = node["leak_window"].as<unsigned int>(def.leak_window);
        rhs.disk_warning_percent = node["disk_warning_percent"].as<unsigned int>(def.disk_warning_percent);
        rhs.disk_critical_percent = node["disk_critical_percent"].as<unsigned int>(def.disk_critical_percent);
        rhs.error_count = node["error_count"].as<unsigned int>(def.error_count);
        rhs.error_tail_lines = node["error_tail_lines"].as<unsigned int>(def.error_tail_lines);
        rhs.error_log_max_age = detail_gw::durationOr(node["error_log_max_age"], def.error_log_max_age);
        return true;
    }
};

template<>
struct convert<RecoveryConfig> {
    static bool decode(const Node& node, RecoveryConfig& rhs) {
        if (!node.IsMap()) return false;
        const RecoveryConfig def;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(def.max_attempts);
        rhs.graceful_settle = detail_gw::durationOr(node["graceful_settle"], def.graceful_settle);
        rhs.hard_settle = detail_gw::durationOr(node["hard_settle"], def.hard_settle);
        return true;
    }
};

template<>
struct convert<DesktopAlertConfig> {
    static bool decode(const Node& node, DesktopAlertConfig& rhs) {
        if (!node.IsMap()) return false;
        const DesktopAlertConfig def;
        rhs.enabled = node["enabled"].as<bool>(def.enabled);
        rhs.command = node["command"].as<std::string>(def.command);
        rhs.sound_warning = node["sound_warning"].as<std::string>(def.sound_warning);
        rhs.sound_critical = node["sound_critical"].as<std::string>(def.sound_critical);
        return true;
    }
};

template<>
struct convert<RemoteAlertConfig> {
    static bool decode(const Node& node, RemoteAlertConfig& rhs) {
        if (!node.IsMap()) return false;
        const RemoteAlertConfig def;
        rhs.enabled = node["enabled"].as<bool>(def.enabled);
        rhs.command = detail_gw::argvOr(node["command"], def.command);
        rhs.timeout = detail_gw::durationOr(node["timeout"], def.timeout);
        rhs.workers = node["workers"].as<unsigned int>(def.workers);
        rhs.queue_limit = node["queue_limit"].as<unsigned int>(def.queue_limit);
        return true;
    }
};

template<>
struct convert<AlertsConfig> {
    static bool decode(const Node& node, AlertsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cooldown = detail_gw::durationOr(node["cooldown"], AlertsConfig{}.cooldown);
        if (const auto desktop = node["desktop"]) rhs.desktop = desktop.as<DesktopAlertConfig>();
        if (const auto remote = node["remote"]) rhs.remote = remote.as<RemoteAlertConfig>();
        return true;
    }
};

template<>
struct convert<BackupConfig> {
    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        const BackupConfig def;
        rhs.volume = node["volume"].as<std::string>(def.volume.string());
        rhs.config_dir = node["config_dir"].as<std::string>(def.config_dir.string());
        rhs.config_glob_prefix = node["config_glob_prefix"].as<std::string>(def.config_glob_prefix);
        rhs.emergency_dir = node["emergency_dir"].as<std::string>(def.emergency_dir.string());
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        const StorageConfig def;
        rhs.data_dir = node["data_dir"].as<std::string>(def.data_dir.string());
        rhs.snapshot_retention = node["snapshot_retention"].as<unsigned int>(def.snapshot_retention);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.gatewatch = detail_gw::levelOr(node["gatewatch"], def.gatewatch);
        rhs.probe = detail_gw::levelOr(node["probe"], def.probe);
        rhs.alert = detail_gw::levelOr(node["alert"], def.alert);
        rhs.recovery = detail_gw::levelOr(node["recovery"], def.recovery);
        rhs.snapshot = detail_gw::levelOr(node["snapshot"], def.snapshot);
        rhs.state = detail_gw::levelOr(node["state"], def.state);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = detail_gw::levelOr(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = detail_gw::levelOr(node["file_log_level"], def.file_log_level);
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        const LoggingConfig def;
        rhs.max_size_bytes = node["max_size"] ? parseMbOrGbToByte(node["max_size"].as<std::string>())
                                              : def.max_size_bytes;
        rhs.keep = node["keep"].as<unsigned int>(def.keep);
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
