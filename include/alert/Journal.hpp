#pragma once

#include "runtime/Clock.hpp"

#include <filesystem>
#include <string_view>

namespace gw::alert {

// Day-per-file markdown log of watchdog events, kept beside the gateway's own notes.
class Journal {
public:
    static constexpr std::string_view SECTION_HEADING = "## Watchdog Events";

    Journal(std::filesystem::path dir, const runtime::Clock& clock);

    // Returns false (and logs) if the entry could not be written
    bool append(std::string_view text) const;

    [[nodiscard]] std::filesystem::path fileFor(runtime::TimePoint tp) const;
    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    const runtime::Clock& clock_;

    [[nodiscard]] bool insideDir(const std::filesystem::path& p) const;
};

}
