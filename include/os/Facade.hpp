#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gw::os {

struct ProcessInfo {
    int pid = 0;
    std::optional<unsigned long> memory_mb;   // empty when RSS could not be read
    double cpu_percent = 0.0;
};

struct CommandResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;

    [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }
};

// Everything the monitor needs from the host. The core depends on this interface only.
class Facade {
public:
    virtual ~Facade() = default;

    // First (lowest pid) process whose command line contains pattern, excluding ourselves.
    virtual std::optional<ProcessInfo> findProcess(const std::string& pattern) = 0;

    virtual bool isVolumeMounted(const std::filesystem::path& mountPoint) = 0;

    // Percentage of the volume holding path that is in use, as df reports it.
    virtual std::optional<double> diskUsagePercent(const std::filesystem::path& path) = 0;

    // Sends the configured graceful-restart signal
    virtual bool sendGracefulSignal(int pid) = 0;

    virtual CommandResult runSupervisorRestart(const std::string& serviceId) = 0;

    virtual CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::seconds timeout) = 0;

    [[nodiscard]] virtual unsigned int currentUid() const = 0;
    [[nodiscard]] virtual std::optional<unsigned int> ownerOf(const std::filesystem::path& path) const = 0;

    [[nodiscard]] bool ownedByCurrentUser(const std::filesystem::path& path) const {
        const auto owner = ownerOf(path);
        return owner && *owner == currentUid();
    }
};

}
