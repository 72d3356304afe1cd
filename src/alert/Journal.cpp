#include "alert/Journal.hpp"
#include "log/Registry.hpp"
#include "util/sanitize.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <sstream>

using namespace gw::alert;
namespace fs = std::filesystem;

Journal::Journal(fs::path dir, const runtime::Clock& clock)
    : dir_(std::move(dir)), clock_(clock) {}

fs::path Journal::fileFor(const runtime::TimePoint tp) const {
    return dir_ / (util::dateString(tp) + ".md");
}

bool Journal::insideDir(const fs::path& p) const {
    std::error_code ec;
    const auto base = fs::weakly_canonical(dir_, ec);
    if (ec) return false;
    const auto resolved = fs::weakly_canonical(p, ec);
    if (ec) return false;
    return resolved.parent_path() == base;
}

bool Journal::append(const std::string_view text) const {
    const auto now = clock_.now();
    const auto file = fileFor(now);

    try {
        if (!fs::exists(dir_)) {
            fs::create_directories(dir_);
            fs::permissions(dir_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                  fs::perms::others_read | fs::perms::others_exec, fs::perm_options::replace);
        }

        if (!insideDir(file)) {
            log::Registry::gatewatch()->error("[Journal] Refusing to write outside {}: {}", dir_.string(), file.string());
            return false;
        }

        std::string prefix;
        if (!fs::exists(file)) {
            prefix = "# " + util::dateString(now) + "\n\n" + std::string(SECTION_HEADING) + "\n";
        } else {
            std::ifstream in(file);
            std::stringstream ss;
            ss << in.rdbuf();
            if (ss.str().find(SECTION_HEADING) == std::string::npos)
                prefix = "\n" + std::string(SECTION_HEADING) + "\n";
        }

        std::ofstream out(file, std::ios::app);
        if (!out) throw std::runtime_error("cannot open " + file.string());
        out << prefix << "- [" << util::clockString(now) << "] " << util::sanitize(text) << "\n";
        if (!out) throw std::runtime_error("write failed on " + file.string());
        return true;
    } catch (const std::exception& e) {
        log::Registry::gatewatch()->warn("[Journal] Failed to append entry: {}", e.what());
        return false;
    }
}
