#pragma once

#include "runtime/Clock.hpp"

#include <filesystem>

namespace gw::health { struct HealthSnapshot; }

namespace gw::metrics {

// World-readable metrics.json, the only thing the status client reads.
class Publisher {
public:
    explicit Publisher(std::filesystem::path file);

    // Throws std::system_error if the file could not be replaced
    void publish(const health::HealthSnapshot& snapshot) const;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
};

}
