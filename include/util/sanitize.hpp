#pragma once

#include <string>
#include <string_view>

namespace gw::util {

// Characters that must never reach an external command line, even one launched without a shell.
constexpr std::string_view UNSAFE_CHARS = ";|&`$(){}[]<>\\\"'";

inline std::string sanitize(const std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (const char c : input)
        if (UNSAFE_CHARS.find(c) == std::string_view::npos) out.push_back(c);
    return out;
}

}
