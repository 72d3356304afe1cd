#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace gw::config {

inline std::chrono::seconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    const char unit = str.back();
    const bool hasUnit = unit == 's' || unit == 'S' || unit == 'm' || unit == 'M' ||
                         unit == 'h' || unit == 'H' || unit == 'd' || unit == 'D';
    const auto value = std::stoull(hasUnit ? str.substr(0, str.size() - 1) : str);

    switch (unit) {
        case 'm': case 'M': return std::chrono::seconds(value * 60);
        case 'h': case 'H': return std::chrono::seconds(value * 3600);
        case 'd': case 'D': return std::chrono::seconds(value * 86400);
        default: return std::chrono::seconds(value); // Assume seconds if no suffix
    }
}

inline std::string durationToString(const std::chrono::seconds d) {
    const auto s = d.count();
    if (s != 0 && s % 86400 == 0) return std::to_string(s / 86400) + "d";
    if (s != 0 && s % 3600 == 0) return std::to_string(s / 3600) + "h";
    if (s != 0 && s % 60 == 0) return std::to_string(s / 60) + "m";
    return std::to_string(s) + "s";
}

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    if (str.size() > 2 && (str.substr(str.size() - 2) == "GB" || str.substr(str.size() - 2) == "gb")) {
        const auto gb = std::stoull(str.substr(0, str.size() - 2));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'G' || str.back() == 'g')) {
        const auto gb = std::stoull(str.substr(0, str.size() - 1));
        return gb * 1024 * 1024 * 1024;
    }

    if (str.size() > 2 && (str.substr(str.size() - 2) == "MB" || str.substr(str.size() - 2) == "mb")) {
        const auto mb = std::stoull(str.substr(0, str.size() - 2));
        return mb * 1024 * 1024;
    }

    if (str.size() > 1 && (str.back() == 'M' || str.back() == 'm')) {
        const auto mb = std::stoull(str.substr(0, str.size() - 1));
        return mb * 1024 * 1024;
    }

    // Assume MB if no suffix
    const auto mb = std::stoull(str);
    return mb * 1024 * 1024;
}

inline std::string bytesToMbOrGbStr(const uintmax_t bytes) {
    if (bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

inline std::filesystem::path expandHome(const std::filesystem::path& p) {
    const auto s = p.string();
    if (s.empty() || s.front() != '~') return p;

    const char* home = std::getenv("HOME");
    if (!home || !*home) throw std::runtime_error("Cannot expand '~' in path, HOME is not set: " + s);

    if (s.size() == 1) return {home};
    if (s[1] != '/') throw std::invalid_argument("Unsupported home expansion in path: " + s);
    return std::filesystem::path(home) / s.substr(2);
}

}
