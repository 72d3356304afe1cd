#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace gw::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = defaultConfigPath());
    static const Config& get();
    static const std::filesystem::path& path() { return path_; }

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline std::filesystem::path path_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace gw::config
