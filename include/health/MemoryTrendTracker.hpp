#pragma once

#include "config/Config.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace gw::health {

// Oldest-first, never longer than its capacity.
class MemoryWindow {
public:
    explicit MemoryWindow(size_t capacity = 10);

    void push(unsigned long sampleMb);

    // Keeps the newest capacity() entries of samples
    void assign(const std::vector<unsigned long>& samples);

    void clear() { samples_.clear(); }

    [[nodiscard]] size_t size() const { return samples_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool full() const { return samples_.size() >= capacity_; }
    [[nodiscard]] bool empty() const { return samples_.empty(); }

    [[nodiscard]] unsigned long oldest() const { return samples_.front(); }
    [[nodiscard]] unsigned long latest() const { return samples_.back(); }

    [[nodiscard]] std::vector<unsigned long> values() const { return {samples_.begin(), samples_.end()}; }

private:
    size_t capacity_;
    std::deque<unsigned long> samples_;
};

struct LeakSignal {
    unsigned long oldest_mb = 0;
    unsigned long latest_mb = 0;
    unsigned long growth_mb = 0;
};

class MemoryTrendTracker {
public:
    explicit MemoryTrendTracker(const config::ThresholdsConfig& thresholds);

    // Appends sampleMb; reports a leak once the window is full and has grown past the threshold.
    std::optional<LeakSignal> observe(MemoryWindow& window, unsigned long sampleMb) const;

private:
    unsigned long growthThresholdMb_;
};

}
