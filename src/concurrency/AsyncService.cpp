#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace gw::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName), token_(std::make_shared<runtime::CancellationToken>()) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    token_->reset();
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::gatewatch()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::gatewatch()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::gatewatch()->info("[{}] Stopping service...", serviceName_);
    token_->cancel();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave the token cancelled until the next start() resets it
    log::Registry::gatewatch()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::gatewatch()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
