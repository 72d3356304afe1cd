#include "log/Registry.hpp"

#include <spdlog/pattern_formatter.h>

#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace gw::log {

namespace {

class LevelFlag final : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string_view text = label(msg);
        dest.append(text.data(), text.data() + text.size());
    }

    [[nodiscard]] std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFlag>();
    }

private:
    static std::string_view label(const spdlog::details::log_msg& msg) {
        if (std::string_view(msg.logger_name.data(), msg.logger_name.size()) == "alert") return "ALERT";
        switch (msg.level) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARN";
            case spdlog::level::err: return "ERROR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "OFF";
        }
    }
};

}

void Registry::applyFormat(spdlog::sink_ptr sink, const char* pattern) {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFlag>('*').set_pattern(pattern);
    sink->set_formatter(std::move(formatter));
}

void Registry::init(const std::filesystem::path& logFile, const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    main_log_path_ = logFile;

    namespace fs = std::filesystem;
    if (const auto dir = main_log_path_.parent_path(); !dir.empty() && !fs::exists(dir)) {
        fs::create_directories(dir);
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    applyFormat(console_sink_, CONSOLE_FORMAT);

    // main file sink (append; rotation is driven by log::Rotator)
    main_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(main_log_path_.string(), /*truncate=*/false);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    applyFormat(main_file_sink_, FILE_FORMAT);
    tightenPermissions();

    file_dist_ = std::make_shared<spdlog::sinks::dist_sink_mt>();
    file_dist_->add_sink(main_file_sink_);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, file_dist_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("gatewatch", sub_levels.gatewatch);
    makeLogger("probe",     sub_levels.probe);
    makeLogger("alert",     sub_levels.alert);
    makeLogger("recovery",  sub_levels.recovery);
    makeLogger("snapshot",  sub_levels.snapshot);
    makeLogger("state",     sub_levels.state);

    initialized_ = true;
    gatewatch()->debug("[LogRegistry] Initialized, main log at {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::tightenPermissions() {
    std::error_code ec;
    std::filesystem::permissions(main_log_path_,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
}

void Registry::reopenMainLog() {
    if (!initialized_) return;

    auto fresh = std::make_shared<spdlog::sinks::basic_file_sink_mt>(main_log_path_.string(), /*truncate=*/false);
    fresh->set_level(main_file_sink_->level());
    applyFormat(fresh, FILE_FORMAT);

    file_dist_->set_sinks({fresh});
    main_file_sink_ = std::move(fresh);
    tightenPermissions();
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::shutdown();
    file_dist_.reset();
    main_file_sink_.reset();
    console_sink_.reset();
    initialized_ = false;
}

}
