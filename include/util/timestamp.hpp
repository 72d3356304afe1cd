#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace gw::util {

inline std::tm toLocalTm(const std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

inline std::tm toUtcTm(const std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

inline std::string formatTm(const std::tm& tm, const char* fmt) {
    char buffer[64];
    const auto n = std::strftime(buffer, sizeof(buffer), fmt, &tm);
    return {buffer, n};
}

inline std::string formatLocal(const std::chrono::system_clock::time_point tp, const char* fmt) {
    return formatTm(toLocalTm(tp), fmt);
}

// "2026-10-17 14:03:59", used for human-readable datetime fields
inline std::string dateTimeString(const std::chrono::system_clock::time_point tp) {
    return formatLocal(tp, "%Y-%m-%d %H:%M:%S");
}

// "2026-10-17", one journal file per calendar day
inline std::string dateString(const std::chrono::system_clock::time_point tp) {
    return formatLocal(tp, "%Y-%m-%d");
}

// "14:03"
inline std::string clockString(const std::chrono::system_clock::time_point tp) {
    return formatLocal(tp, "%H:%M");
}

// "20261017-140359-123Z" in UTC, fixed width so lexical order is chronological order
// even across a DST fall-back
inline std::string fileStamp(const std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "-%03lldZ", static_cast<long long>(ms));
    return formatTm(toUtcTm(tp), "%Y%m%d-%H%M%S") + suffix;
}

inline long long toEpochSeconds(const std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochSeconds(const long long secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

} // namespace gw::util
