#include <gtest/gtest.h>
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using gw::log::Registry;

TEST(LogRegistryTest, ReopenWhileOtherThreadsLog) {
    std::atomic<bool> done{false};
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t)
        writers.emplace_back([&done, t] {
            for (int i = 0; !done.load(); ++i)
                Registry::gatewatch()->info("[LogRegistryTest] writer {} line {}", t, i);
        });

    for (int i = 0; i < 50; ++i) Registry::reopenMainLog();

    done = true;
    for (auto& w : writers) w.join();

    Registry::gatewatch()->info("[LogRegistryTest] reopened under load");
    EXPECT_NE(gw::util::readFileToString(Registry::mainLogPath()).find("[LogRegistryTest] reopened under load"),
              std::string::npos);
}

TEST(LogRegistryTest, ReopenFollowsRenamedFile) {
    const auto active = Registry::mainLogPath();
    const fs::path moved = active.string() + ".moved";

    Registry::gatewatch()->info("[LogRegistryTest] before rename");
    fs::rename(active, moved);
    Registry::reopenMainLog();
    Registry::gatewatch()->info("[LogRegistryTest] after rename");

    const auto oldText = gw::util::readFileToString(moved);
    const auto newText = gw::util::readFileToString(active);
    EXPECT_NE(oldText.find("before rename"), std::string::npos);
    EXPECT_EQ(oldText.find("after rename"), std::string::npos);
    EXPECT_NE(newText.find("after rename"), std::string::npos);
    EXPECT_EQ(newText.find("before rename"), std::string::npos);

    fs::remove(moved);
}
