#pragma once

#include "config/Config.hpp"
#include "runtime/Clock.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace gw::util { class HttpClient; }
namespace gw::os { class Facade; }
namespace gw::alert { class Dispatcher; class Journal; }
namespace gw::runtime { struct Context; }

namespace gw::snapshot {

struct SnapshotRecord {
    runtime::TimePoint at;
    std::optional<std::filesystem::path> sessions;   // absent when the gateway had nothing to give
    std::optional<std::filesystem::path> memory;
};

class Manager {
public:
    static constexpr std::string_view SESSIONS_PREFIX = "sessions-";
    static constexpr std::string_view MEMORY_PREFIX = "memory-";

    Manager(const config::Config& cfg, util::HttpClient& http, os::Facade& os,
            const runtime::Clock& clock, alert::Dispatcher& alerts, const alert::Journal& journal);

    // Best effort: a failed session fetch or copy is logged, never thrown.
    SnapshotRecord capture();

    // Copies the gateway workspace to the backup volume. nullopt if the volume is absent or the copy failed.
    std::optional<std::filesystem::path> emergencyBackup();

    // Replaces the live gateway config with the newest trusted backup. Alerts either way.
    bool restoreConfigFromBackup(runtime::Context& ctx);

    // Newest first
    [[nodiscard]] std::vector<std::filesystem::path> artifacts(std::string_view prefix) const;

    void enforceRetention() const;

private:
    const config::Config& cfg_;
    util::HttpClient& http_;
    os::Facade& os_;
    const runtime::Clock& clock_;
    alert::Dispatcher& alerts_;
    const alert::Journal& journal_;

    std::optional<std::filesystem::path> captureSessions(const std::string& stamp) const;
    std::optional<std::filesystem::path> captureMemory(const std::string& stamp) const;

    [[nodiscard]] std::vector<std::filesystem::path> configBackupsNewestFirst() const;
};

}
