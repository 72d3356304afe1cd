#include "os/LinuxFacade.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <stdexcept>
#include <unordered_map>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace gw::os;
namespace fs = std::filesystem;

namespace {

constexpr auto WAIT_POLL = std::chrono::milliseconds(50);

bool isPidDir(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](const unsigned char c) { return std::isdigit(c); });
}

std::string readCmdline(const int pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!in) return {};
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::replace(raw.begin(), raw.end(), '\0', ' ');
    return raw;
}

}

LinuxFacade::LinuxFacade(const std::string& gracefulSignal,
                         std::vector<std::string> restartCommand,
                         const std::chrono::seconds commandTimeout)
    : gracefulSignal_(signalFromName(gracefulSignal)),
      restartCommand_(std::move(restartCommand)),
      commandTimeout_(commandTimeout) {
    if (restartCommand_.empty()) throw std::invalid_argument("Supervisor restart command must not be empty");
}

int LinuxFacade::signalFromName(const std::string& name) {
    static const std::unordered_map<std::string, int> table = {
        {"HUP", SIGHUP}, {"INT", SIGINT}, {"QUIT", SIGQUIT}, {"TERM", SIGTERM},
        {"USR1", SIGUSR1}, {"USR2", SIGUSR2}, {"KILL", SIGKILL},
    };

    if (!name.empty() && std::all_of(name.begin(), name.end(), [](const unsigned char c) { return std::isdigit(c); }))
        return std::stoi(name);

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](const unsigned char c) { return std::toupper(c); });
    if (key.rfind("SIG", 0) == 0) key.erase(0, 3);

    const auto it = table.find(key);
    if (it == table.end()) throw std::invalid_argument("Unknown signal name: " + name);
    return it->second;
}

std::string LinuxFacade::unescapeMountField(const std::string& field) {
    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const auto oct = field.substr(i + 1, 3);
            if (std::all_of(oct.begin(), oct.end(), [](const char c) { return c >= '0' && c <= '7'; })) {
                out.push_back(static_cast<char>(std::stoi(oct, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

std::optional<ProcessInfo> LinuxFacade::findProcess(const std::string& pattern) {
    if (pattern.empty()) return std::nullopt;

    const int self = static_cast<int>(::getpid());
    std::optional<int> match;

    std::error_code ec;
    for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (!isPidDir(name)) continue;

        const int pid = std::stoi(name);
        if (pid == self) continue;
        if (match && pid >= *match) continue;

        // Processes may exit between listing and reading; an empty cmdline is just skipped
        if (readCmdline(pid).find(pattern) != std::string::npos) match = pid;
    }

    if (!match) return std::nullopt;

    ProcessInfo info;
    info.pid = *match;
    info.memory_mb = readRssMb(*match);
    info.cpu_percent = readCpuPercent(*match).value_or(0.0);
    return info;
}

std::optional<unsigned long> LinuxFacade::readRssMb(const int pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/status");
    if (!in) return std::nullopt;

    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("VmRSS:", 0) != 0) continue;
        std::istringstream iss(line.substr(6));
        unsigned long kb = 0;
        if (!(iss >> kb)) return std::nullopt;
        return kb / 1024;
    }
    return std::nullopt;
}

std::optional<double> LinuxFacade::readCpuPercent(const int pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());

    // comm may contain spaces and parentheses; fields resume after the last ')'
    const auto close = content.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream iss(content.substr(close + 1));
    std::vector<std::string> fields;
    for (std::string f; iss >> f;) fields.push_back(std::move(f));

    // fields[0] is state (field 3); utime=14, stime=15, starttime=22
    if (fields.size() < 20) return std::nullopt;
    const double utime = std::stod(fields[11]);
    const double stime = std::stod(fields[12]);
    const double start = std::stod(fields[19]);

    std::ifstream up("/proc/uptime");
    double uptime = 0.0;
    if (!(up >> uptime)) return std::nullopt;

    const double hz = static_cast<double>(::sysconf(_SC_CLK_TCK));
    const double elapsed = uptime - start / hz;
    if (hz <= 0 || elapsed <= 0) return 0.0;

    return 100.0 * ((utime + stime) / hz) / elapsed;
}

bool LinuxFacade::isVolumeMounted(const fs::path& mountPoint) {
    std::ifstream in("/proc/self/mounts");
    if (!in) {
        log::Registry::gatewatch()->warn("[LinuxFacade] Cannot read /proc/self/mounts");
        return false;
    }

    const auto wanted = mountPoint.lexically_normal().string();
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string device, target;
        if (!(iss >> device >> target)) continue;
        if (fs::path(unescapeMountField(target)).lexically_normal().string() == wanted) return true;
    }
    return false;
}

std::optional<double> LinuxFacade::diskUsagePercent(const fs::path& path) {
    struct statvfs st{};
    if (::statvfs(path.c_str(), &st) != 0) {
        log::Registry::gatewatch()->warn("[LinuxFacade] statvfs({}) failed: {}", path.string(), std::strerror(errno));
        return std::nullopt;
    }

    const auto used = static_cast<double>(st.f_blocks - st.f_bfree);
    const auto avail = static_cast<double>(st.f_bavail);
    if (used + avail <= 0) return 0.0;
    return 100.0 * used / (used + avail);
}

bool LinuxFacade::sendGracefulSignal(const int pid) {
    if (pid <= 0) return false;
    if (::kill(pid, gracefulSignal_) != 0) {
        log::Registry::gatewatch()->warn("[LinuxFacade] kill({}, {}) failed: {}", pid, gracefulSignal_, std::strerror(errno));
        return false;
    }
    return true;
}

CommandResult LinuxFacade::runSupervisorRestart(const std::string& serviceId) {
    std::vector<std::string> argv = restartCommand_;
    for (auto& arg : argv)
        for (auto pos = arg.find("{service}"); pos != std::string::npos; pos = arg.find("{service}", pos + serviceId.size()))
            arg.replace(pos, 9, serviceId);
    return runCommand(argv, commandTimeout_);
}

CommandResult LinuxFacade::runCommand(const std::vector<std::string>& argv, const std::chrono::seconds timeout) {
    CommandResult result;
    if (argv.empty()) return result;

    // Build everything before fork; the child may only make async-signal-safe calls
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1) {
        log::Registry::gatewatch()->error("[LinuxFacade] fork failed for {}: {}", argv.front(), std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execvp(c_args[0], c_args.data());
        ::_exit(127);
    }

    result.launched = true;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;

    while (true) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r == -1 && errno != EINTR) {
            log::Registry::gatewatch()->error("[LinuxFacade] waitpid failed for {}: {}", argv.front(), std::strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            result.timed_out = true;
            log::Registry::gatewatch()->warn("[LinuxFacade] {} killed after {}s timeout", argv.front(), timeout.count());
            return result;
        }
        std::this_thread::sleep_for(WAIT_POLL);
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);

    if (result.exit_code == 127) result.launched = false;  // execvp failed in the child
    return result;
}

unsigned int LinuxFacade::currentUid() const {
    return static_cast<unsigned int>(::geteuid());
}

std::optional<unsigned int> LinuxFacade::ownerOf(const fs::path& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return std::nullopt;
    return static_cast<unsigned int>(st.st_uid);
}
