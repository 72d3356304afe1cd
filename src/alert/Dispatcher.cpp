#include "alert/Dispatcher.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"
#include "runtime/Context.hpp"
#include "util/sanitize.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace gw::alert;

namespace {

struct RemoteDispatchTask final : gw::concurrency::Task {
    std::shared_ptr<Sink> sink;
    Notification notification;

    RemoteDispatchTask(std::shared_ptr<Sink> s, Notification n)
        : sink(std::move(s)), notification(std::move(n)) {}

    void operator()() override {
        try {
            sink->deliver(notification);
        } catch (const std::exception& e) {
            gw::log::Registry::gatewatch()->warn("[AlertDispatcher] {} sink failed for {}: {}",
                                                 sink->name(), notification.type, e.what());
        }
    }

    [[nodiscard]] std::string describe() const override {
        return sink->name() + " alert " + notification.type;
    }
};

}

Dispatcher::Dispatcher(const config::AlertsConfig& cfg, const runtime::Clock& clock,
                       const Journal& journal, concurrency::ThreadPool& remotePool)
    : cfg_(cfg), clock_(clock), journal_(journal), remotePool_(remotePool) {}

void Dispatcher::addLocalSink(std::shared_ptr<Sink> sink) {
    if (!sink) throw std::invalid_argument("null alert sink");
    local_.push_back(std::move(sink));
}

void Dispatcher::addRemoteSink(std::shared_ptr<Sink> sink) {
    if (!sink) throw std::invalid_argument("null alert sink");
    remote_.push_back(std::move(sink));
}

bool Dispatcher::inCooldown(const runtime::Context& ctx, const std::string& type) const {
    const auto it = ctx.alerts.find(type);
    if (it == ctx.alerts.end()) return false;
    return clock_.now() - it->second < cfg_.cooldown;
}

bool Dispatcher::notify(runtime::Context& ctx, const std::string_view type, const std::string_view message,
                        const Severity severity) {
    Notification n{util::sanitize(type), util::sanitize(message), severity, clock_.now()};

    if (inCooldown(ctx, n.type)) {
        log::Registry::gatewatch()->debug("[AlertDispatcher] Suppressed {} (cooldown)", n.type);
        return false;
    }

    ctx.alerts[n.type] = n.at;

    logFired(n);
    journal_.append(fmt::format("🚨 [{}] {}", to_string(severity), n.message));

    for (const auto& sink : local_) {
        try {
            sink->deliver(n);
        } catch (const std::exception& e) {
            log::Registry::gatewatch()->warn("[AlertDispatcher] {} sink failed for {}: {}", sink->name(), n.type, e.what());
        }
    }

    for (const auto& sink : remote_) {
        if (!remotePool_.submit(std::make_shared<RemoteDispatchTask>(sink, n)))
            log::Registry::gatewatch()->warn("[AlertDispatcher] Remote queue full, dropped {} for {}", n.type, sink->name());
    }

    return true;
}

void Dispatcher::logFired(const Notification& n) const {
    const auto line = fmt::format("[{}] {}: {}", to_string(n.severity), n.type, n.message);
    switch (n.severity) {
        case Severity::Critical: log::Registry::alert()->critical(line); break;
        case Severity::Warning: log::Registry::alert()->warn(line); break;
        default: log::Registry::alert()->info(line);
    }
}
