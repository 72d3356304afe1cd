#include "util/hash.hpp"
#include "util/files.hpp"

#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace gw::util {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::optional<std::string> sha256File(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
    try {
        return sha256Hex(readFileToString(path));
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

}
