#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace gw::util {

std::string sha256Hex(const std::string& data);

// Hex digest of the file's contents, or nullopt if it cannot be read.
std::optional<std::string> sha256File(const std::filesystem::path& path);

}
