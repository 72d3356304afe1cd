#include "health/MemoryTrendTracker.hpp"

#include <algorithm>

using namespace gw::health;

MemoryWindow::MemoryWindow(const size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void MemoryWindow::push(const unsigned long sampleMb) {
    samples_.push_back(sampleMb);
    while (samples_.size() > capacity_) samples_.pop_front();
}

void MemoryWindow::assign(const std::vector<unsigned long>& samples) {
    samples_.clear();
    const auto skip = samples.size() > capacity_ ? samples.size() - capacity_ : 0;
    samples_.insert(samples_.end(), samples.begin() + static_cast<std::ptrdiff_t>(skip), samples.end());
}

MemoryTrendTracker::MemoryTrendTracker(const config::ThresholdsConfig& thresholds)
    : growthThresholdMb_(thresholds.leak_growth_mb) {}

std::optional<LeakSignal> MemoryTrendTracker::observe(MemoryWindow& window, const unsigned long sampleMb) const {
    window.push(sampleMb);
    if (!window.full()) return std::nullopt;

    // Memory can shrink across the window; that is never a leak
    if (window.latest() <= window.oldest()) return std::nullopt;

    const auto growth = window.latest() - window.oldest();
    if (growth <= growthThresholdMb_) return std::nullopt;

    return LeakSignal{window.oldest(), window.latest(), growth};
}
