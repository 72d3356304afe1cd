#include <gtest/gtest.h>
#include "health/MemoryTrendTracker.hpp"

#include <vector>

using namespace gw::health;

class MemoryTrendTrackerTest : public ::testing::Test {
protected:
    gw::config::ThresholdsConfig thresholds;
    MemoryTrendTracker tracker{thresholds};
    MemoryWindow window{10};
};

TEST_F(MemoryTrendTrackerTest, LeakReportedOnlyOnceWindowIsFull) {
    const std::vector<unsigned long> readings = {400, 410, 420, 430, 440, 450, 460, 460, 460, 460};

    int fired = 0;
    for (size_t i = 0; i < readings.size(); ++i) {
        const auto signal = tracker.observe(window, readings[i]);
        if (i + 1 < readings.size()) {
            EXPECT_FALSE(signal.has_value()) << "fired early at reading " << i + 1;
        } else {
            ASSERT_TRUE(signal.has_value());
            EXPECT_EQ(signal->oldest_mb, 400u);
            EXPECT_EQ(signal->latest_mb, 460u);
            EXPECT_EQ(signal->growth_mb, 60u);
        }
        if (signal) ++fired;
    }
    EXPECT_EQ(fired, 1);
}

TEST_F(MemoryTrendTrackerTest, WindowNeverExceedsCapacity) {
    for (unsigned long mb = 100; mb < 130; ++mb) {
        tracker.observe(window, mb);
        EXPECT_LE(window.size(), 10u);
    }
    EXPECT_EQ(window.oldest(), 120u);
    EXPECT_EQ(window.latest(), 129u);
}

TEST_F(MemoryTrendTrackerTest, GrowthOfExactlyThresholdIsNotALeak) {
    for (int i = 0; i < 9; ++i) tracker.observe(window, 400);
    EXPECT_FALSE(tracker.observe(window, 450).has_value());

    window.clear();
    for (int i = 0; i < 9; ++i) tracker.observe(window, 400);
    EXPECT_TRUE(tracker.observe(window, 451).has_value());
}

TEST_F(MemoryTrendTrackerTest, ShrinkingMemoryIsNotALeak) {
    for (unsigned long mb = 800; mb > 700; mb -= 10) tracker.observe(window, mb);
    EXPECT_TRUE(window.full());
    EXPECT_FALSE(tracker.observe(window, 500).has_value());
}

TEST_F(MemoryTrendTrackerTest, AssignKeepsNewestSamples) {
    std::vector<unsigned long> history;
    for (unsigned long i = 1; i <= 15; ++i) history.push_back(i);

    window.assign(history);
    EXPECT_EQ(window.size(), 10u);
    EXPECT_EQ(window.oldest(), 6u);
    EXPECT_EQ(window.latest(), 15u);
}
