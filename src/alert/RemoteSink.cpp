#include "alert/RemoteSink.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace gw::alert;

namespace {
constexpr std::string_view MESSAGE_TOKEN = "{message}";
}

RemoteSink::RemoteSink(const config::RemoteAlertConfig& cfg, std::shared_ptr<os::Facade> os)
    : cfg_(cfg), os_(std::move(os)) {
    if (!os_) throw std::invalid_argument("Remote alert sink needs an OS facade");
    if (cfg_.command.empty()) throw std::invalid_argument("Remote alert command must not be empty");
}

std::string RemoteSink::decorate(const Notification& n) {
    return fmt::format("[{}] Watchdog: {}", to_string(n.severity), n.message);
}

std::vector<std::string> RemoteSink::buildCommand(const Notification& n) const {
    const auto text = decorate(n);
    std::vector<std::string> argv = cfg_.command;
    for (auto& arg : argv)
        if (const auto pos = arg.find(MESSAGE_TOKEN); pos != std::string::npos)
            arg.replace(pos, MESSAGE_TOKEN.size(), text);
    return argv;
}

void RemoteSink::deliver(const Notification& n) {
    const auto argv = buildCommand(n);
    const auto result = os_->runCommand(argv, cfg_.timeout);
    if (!result.launched) throw std::runtime_error("could not launch " + argv.front());
    if (result.timed_out) throw std::runtime_error(fmt::format("{} timed out after {}s", argv.front(), cfg_.timeout.count()));
    if (result.exit_code != 0) throw std::runtime_error(fmt::format("{} exited with {}", argv.front(), result.exit_code));
}
