#pragma once

#include "alert/Alert.hpp"
#include "alert/Journal.hpp"
#include "alert/Sink.hpp"
#include "config/Config.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace gw::concurrency { class ThreadPool; }
namespace gw::runtime { struct Context; }

namespace gw::alert {

class Dispatcher {
public:
    Dispatcher(const config::AlertsConfig& cfg, const runtime::Clock& clock,
               const Journal& journal, concurrency::ThreadPool& remotePool);

    // Runs on the calling thread, in registration order
    void addLocalSink(std::shared_ptr<Sink> sink);

    // Queued on the remote pool, never awaited
    void addRemoteSink(std::shared_ptr<Sink> sink);

    // Returns true if the alert fired, false if it was inside its cooldown window.
    bool notify(runtime::Context& ctx, std::string_view type, std::string_view message, Severity severity);

    [[nodiscard]] bool inCooldown(const runtime::Context& ctx, const std::string& type) const;

private:
    const config::AlertsConfig& cfg_;
    const runtime::Clock& clock_;
    const Journal& journal_;
    concurrency::ThreadPool& remotePool_;

    std::vector<std::shared_ptr<Sink>> local_;
    std::vector<std::shared_ptr<Sink>> remote_;

    void logFired(const Notification& n) const;
};

}
