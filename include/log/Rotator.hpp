#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <mutex>

namespace gw::log {

constexpr std::uint64_t operator"" _MiB(unsigned long long v) { return v * 1024ULL * 1024ULL; }

// Size-triggered rotation with numbered history: watchdog.log -> watchdog.log.1 -> ... -> watchdog.log.<keep>
class Rotator {
public:
    struct Options {
        // Active file, e.g. ~/.gatewatch/watchdog.log
        std::filesystem::path active_path;

        // Rotate when size > max_bytes
        std::uint64_t max_bytes = 10_MiB;

        // Number of rotated files kept beside the active one
        unsigned int keep = 5;

        // Hooks
        std::function<void()> on_reopen = nullptr;                       // called after rename of active file
        std::function<void(std::string_view)> diag_log = nullptr;        // lightweight diagnostics

        // Where to place an advisory lock to avoid concurrent rotations
        std::optional<std::filesystem::path> lock_dir = std::nullopt;
    };

    explicit Rotator(Options opts);

    // Returns true if the active file was rotated
    bool maybeRotate() const;

    [[nodiscard]] std::filesystem::path rotatedPath(unsigned int index) const;

private:
    Options opts_;
    mutable std::mutex m_;

    bool oversized() const;

    class FileLock {
    public:
        explicit FileLock(std::filesystem::path p);
        ~FileLock();
        FileLock(const FileLock&) = delete;
        FileLock& operator=(const FileLock&) = delete;
    private:
        std::filesystem::path path_;
        int fd_{-1};
    };

    void rotateImpl(std::string_view why) const;
};

}
