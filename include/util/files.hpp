#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gw::util {

constexpr auto OWNER_ONLY = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
constexpr auto WORLD_READABLE = OWNER_ONLY | std::filesystem::perms::group_read | std::filesystem::perms::others_read;

std::string readFileToString(const std::filesystem::path& path);

// Write to a sibling temp file, chmod, then rename over the target so readers never see a partial file.
void atomicWrite(const std::filesystem::path& path, const std::string& content,
                 std::filesystem::perms mode = OWNER_ONLY);

// Last n lines of a text file (fewer if the file is shorter).
std::vector<std::string> tailLines(const std::filesystem::path& path, std::size_t n);

// Recursive copy; every copied entry gets owner-only permissions.
void copyTreeOwnerOnly(const std::filesystem::path& src, const std::filesystem::path& dst);

void ensureDirectory(const std::filesystem::path& dir, std::filesystem::perms mode);

std::string generate_random_suffix(size_t length = 8);

}
