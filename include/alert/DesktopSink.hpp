#pragma once

#include "alert/Sink.hpp"
#include "config/Config.hpp"
#include "os/Facade.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace gw::alert {

// notify-send style desktop popup. Runs synchronously with a short timeout.
class DesktopSink final : public Sink {
public:
    DesktopSink(const config::DesktopAlertConfig& cfg, os::Facade& os, std::chrono::seconds timeout);

    [[nodiscard]] std::string name() const override { return "desktop"; }
    void deliver(const Notification& n) override;

    [[nodiscard]] std::vector<std::string> buildCommand(const Notification& n) const;

private:
    const config::DesktopAlertConfig& cfg_;
    os::Facade& os_;
    std::chrono::seconds timeout_;
};

}
