#pragma once

#include "alert/Sink.hpp"
#include "config/Config.hpp"
#include "os/Facade.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gw::alert {

// Hands the message to an external message-send command. Always run off the monitor thread,
// so it shares ownership of the facade with the tasks still queued for it.
class RemoteSink final : public Sink {
public:
    RemoteSink(const config::RemoteAlertConfig& cfg, std::shared_ptr<os::Facade> os);

    [[nodiscard]] std::string name() const override { return "remote"; }
    void deliver(const Notification& n) override;

    [[nodiscard]] std::vector<std::string> buildCommand(const Notification& n) const;

    static std::string decorate(const Notification& n);

private:
    const config::RemoteAlertConfig& cfg_;
    std::shared_ptr<os::Facade> os_;
};

}
