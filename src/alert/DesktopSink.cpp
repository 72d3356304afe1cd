#include "alert/DesktopSink.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace gw::alert;

DesktopSink::DesktopSink(const config::DesktopAlertConfig& cfg, os::Facade& os, const std::chrono::seconds timeout)
    : cfg_(cfg), os_(os), timeout_(timeout) {}

std::vector<std::string> DesktopSink::buildCommand(const Notification& n) const {
    const bool critical = n.severity == Severity::Critical;
    const char* urgency = critical ? "critical"
                        : n.severity == Severity::Warning ? "normal" : "low";
    const auto& sound = critical ? cfg_.sound_critical : cfg_.sound_warning;

    return {
        cfg_.command,
        "-u", urgency,
        "-h", "string:sound-name:" + sound,
        fmt::format("Watchdog [{}]", to_string(n.severity)),
        n.message
    };
}

void DesktopSink::deliver(const Notification& n) {
    const auto result = os_.runCommand(buildCommand(n), timeout_);
    if (!result.launched) throw std::runtime_error("could not launch " + cfg_.command);
    if (result.timed_out) throw std::runtime_error(cfg_.command + " timed out");
    if (result.exit_code != 0) throw std::runtime_error(fmt::format("{} exited with {}", cfg_.command, result.exit_code));
}
