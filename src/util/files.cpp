#include "util/files.hpp"

#include <cerrno>
#include <deque>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

std::string gw::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

void gw::util::atomicWrite(const fs::path& path, const std::string& content, const fs::perms mode) {
    const auto tmp = path.parent_path() / ("." + path.filename().string() + ".tmp." + generate_random_suffix());

    const int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "Failed to create temp file " + tmp.string());

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        const auto n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::system_error(err, std::generic_category(), "Failed to write temp file " + tmp.string());
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    ::fsync(fd);
    ::close(fd);

    std::error_code ec;
    fs::permissions(tmp, mode, fs::perm_options::replace, ec);
    if (!ec) fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp);
        throw std::system_error(ec, "Failed to publish " + path.string());
    }
}

std::vector<std::string> gw::util::tailLines(const fs::path& path, const std::size_t n) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        window.push_back(std::move(line));
        if (window.size() > n) window.pop_front();
    }
    return {window.begin(), window.end()};
}

void gw::util::copyTreeOwnerOnly(const fs::path& src, const fs::path& dst) {
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::copy_symlinks);

    std::error_code ec;
    fs::permissions(dst, fs::perms::owner_all, fs::perm_options::replace, ec);
    for (auto it = fs::recursive_directory_iterator(dst, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_symlink(ec)) continue;
        const auto mode = it->is_directory(ec) ? fs::perms::owner_all : OWNER_ONLY;
        fs::permissions(it->path(), mode, fs::perm_options::replace, ec);
    }
}

void gw::util::ensureDirectory(const fs::path& dir, const fs::perms mode) {
    fs::create_directories(dir);
    fs::permissions(dir, mode, fs::perm_options::replace);
}

std::string gw::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}
