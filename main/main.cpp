#include "runtime/Manager.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace gw::config;

namespace {
std::atomic<int> receivedSignal{0};

void signalHandler(const int signum) {
    receivedSignal = signum;
}
}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(argc > 1 ? std::filesystem::path(argv[1]) : defaultConfigPath());
    } catch (const std::exception& e) {
        std::cerr << "gatewatchd: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        gw::log::Registry::init(cfg.storage.logFile(), cfg.logging);

        gw::log::Registry::gatewatch()->info("[*] Loaded configuration from {}", ConfigRegistry::path().string());
        gw::log::Registry::gatewatch()->debug("[*] Effective configuration: {}", nlohmann::json(cfg).dump());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto& manager = gw::runtime::Manager::instance();
        manager.startAll();
        gw::log::Registry::gatewatch()->info("[*] Watchdog running.");

        while (receivedSignal == 0 && !manager.failed()) std::this_thread::sleep_for(std::chrono::milliseconds(250));

        if (manager.failed()) {
            gw::log::Registry::gatewatch()->critical("[!] Monitoring cannot be kept alive, exiting for the supervisor to restart us");
            manager.stopAll(SIGTERM);
            gw::log::Registry::shutdown();
            return EXIT_FAILURE;
        }

        gw::log::Registry::gatewatch()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        manager.stopAll(receivedSignal);

        gw::log::Registry::gatewatch()->info("[✓] Watchdog shut down cleanly.");
        gw::log::Registry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (gw::log::Registry::isInitialized()) {
            gw::log::Registry::gatewatch()->critical("[!] Fatal error: {}", e.what());
            gw::log::Registry::shutdown();
        } else {
            std::cerr << "gatewatchd: " << e.what() << std::endl;
        }
        return EXIT_FAILURE;
    }
}
