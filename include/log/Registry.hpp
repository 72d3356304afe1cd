#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <filesystem>

namespace gw::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. The main log file lives at logFile.
    static void init(const std::filesystem::path& logFile, const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> gatewatch() { return get("gatewatch"); }
    static std::shared_ptr<spdlog::logger> probe()     { return get("probe"); }
    static std::shared_ptr<spdlog::logger> alert()     { return get("alert"); }
    static std::shared_ptr<spdlog::logger> recovery()  { return get("recovery"); }
    static std::shared_ptr<spdlog::logger> snapshot()  { return get("snapshot"); }
    static std::shared_ptr<spdlog::logger> state()     { return get("state"); }

    [[nodiscard]] static bool isInitialized();
    [[nodiscard]] static const std::filesystem::path& mainLogPath() { return main_log_path_; }

    // Swap the file sink for a fresh one on the same path, after the active file was renamed.
    // Safe while other threads are logging.
    static void reopenMainLog();

    static void shutdown();

private:
    // %* renders the upper-case level, or ALERT for the alert logger
    static constexpr const auto* FILE_FORMAT = "[%Y-%m-%d %H:%M:%S] [%*] %v";
    static constexpr const auto* CONSOLE_FORMAT = "[%Y-%m-%d %H:%M:%S] [%^%*%$] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> main_file_sink_;

    // Every logger holds this one; the file sink is swapped inside it under its own lock
    static inline std::shared_ptr<spdlog::sinks::dist_sink_mt> file_dist_;

    static void applyFormat(spdlog::sink_ptr sink, const char* pattern);
    static void tightenPermissions();
};

}
