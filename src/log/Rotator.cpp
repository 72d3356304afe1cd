#include "log/Rotator.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace gw::log;

Rotator::Rotator(Options opts)
    : opts_(std::move(opts)) {
    if (opts_.active_path.empty())
        throw std::invalid_argument("Rotator: active_path is empty.");
    if (opts_.keep == 0)
        throw std::invalid_argument("Rotator: keep must be at least 1.");
    if (!opts_.lock_dir) opts_.lock_dir = opts_.active_path.parent_path();
}

bool Rotator::maybeRotate() const {
    std::scoped_lock lk(m_);
    if (!oversized()) return false;
    rotateImpl("size");
    return true;
}

std::filesystem::path Rotator::rotatedPath(const unsigned int index) const {
    return opts_.active_path.string() + "." + std::to_string(index);
}

bool Rotator::oversized() const {
    std::error_code ec;
    if (!std::filesystem::exists(opts_.active_path, ec)) return false; // nothing to rotate
    const auto size = std::filesystem::file_size(opts_.active_path, ec);
    return !ec && size > opts_.max_bytes;
}

// ===== FileLock =====

Rotator::FileLock::FileLock(std::filesystem::path p) : path_(std::move(p)) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR, 0600);
    if (fd_ < 0) throw std::runtime_error("FileLock: open failed");
    if (flock(fd_, LOCK_EX) != 0) {
        ::close(fd_); fd_ = -1;
        throw std::runtime_error("FileLock: flock failed");
    }
}

Rotator::FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

// ===== rotation =====

void Rotator::rotateImpl(const std::string_view why) const {
    namespace fs = std::filesystem;

    // Prevent concurrent rotation across processes
    const auto lockfile = *opts_.lock_dir / (opts_.active_path.filename().string() + ".rotate.lock");
    std::optional<FileLock> lk;
    try {
        lk.emplace(lockfile);
    } catch (const std::exception& e) {
        if (opts_.diag_log) opts_.diag_log(std::string("rotate: proceeding without lock: ") + e.what());
    }

    std::error_code ec;
    if (!fs::exists(opts_.active_path, ec)) return;

    // Oldest falls off the end, the rest shift up by one
    fs::remove(rotatedPath(opts_.keep), ec);
    for (unsigned int i = opts_.keep - 1; i >= 1; --i) {
        const auto from = rotatedPath(i);
        if (fs::exists(from, ec)) {
            fs::rename(from, rotatedPath(i + 1), ec);
            if (ec && opts_.diag_log) opts_.diag_log("rotate: shift failed for " + from.string() + ": " + ec.message());
        }
    }

    fs::rename(opts_.active_path, rotatedPath(1), ec);
    if (ec) {
        if (opts_.diag_log) opts_.diag_log(std::string("rotate: rename failed: ") + ec.message());
        return;
    }

    // Re-open / recreate active file
    if (opts_.on_reopen) {
        try {
            opts_.on_reopen();
        } catch (const std::exception& e) {
            if (opts_.diag_log) opts_.diag_log(std::string("rotate: reopen hook failed: ") + e.what());
        }
    } else {
        // Touch new active in case writers open by path without explicit reopen hook
        if (FILE* f = std::fopen(opts_.active_path.c_str(), "ab")) std::fclose(f);
    }
    fs::permissions(opts_.active_path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);

    if (opts_.diag_log) {
        std::ostringstream os;
        os << "rotate: completed (" << why << ") -> " << rotatedPath(1).filename().string();
        opts_.diag_log(os.str());
    }
}
