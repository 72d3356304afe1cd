#pragma once

#include "os/Facade.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace gw::os {

class LinuxFacade final : public Facade {
public:
    LinuxFacade(const std::string& gracefulSignal,
                std::vector<std::string> restartCommand,
                std::chrono::seconds commandTimeout);

    std::optional<ProcessInfo> findProcess(const std::string& pattern) override;
    bool isVolumeMounted(const std::filesystem::path& mountPoint) override;
    std::optional<double> diskUsagePercent(const std::filesystem::path& path) override;
    bool sendGracefulSignal(int pid) override;
    CommandResult runSupervisorRestart(const std::string& serviceId) override;
    CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::seconds timeout) override;

    [[nodiscard]] unsigned int currentUid() const override;
    [[nodiscard]] std::optional<unsigned int> ownerOf(const std::filesystem::path& path) const override;

    // "SIGUSR1", "USR1" or a number
    static int signalFromName(const std::string& name);

    // /proc/mounts escapes whitespace as octal (\040)
    static std::string unescapeMountField(const std::string& field);

private:
    int gracefulSignal_;
    std::vector<std::string> restartCommand_;
    std::chrono::seconds commandTimeout_;

    static std::optional<unsigned long> readRssMb(int pid);
    static std::optional<double> readCpuPercent(int pid);
};

}
