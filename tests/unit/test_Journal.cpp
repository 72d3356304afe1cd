#include <gtest/gtest.h>
#include "alert/Journal.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include "support/ManualClock.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using gw::alert::Journal;

class JournalTest : public ::testing::Test {
protected:
    fs::path dir;
    gw::test::ManualClock clock;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("gatewatch-journal-" + gw::util::generate_random_suffix()) / "memory";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir.parent_path(), ec);
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static size_t occurrences(const std::string& text, const std::string& needle) {
        size_t n = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) ++n;
        return n;
    }
};

TEST_F(JournalTest, CreatesDayFileWithHeading) {
    const Journal j(dir, clock);
    ASSERT_TRUE(j.append("🐕 Watchdog started"));

    const auto file = j.fileFor(clock.now());
    EXPECT_EQ(file.filename().string(), gw::util::dateString(clock.now()) + ".md");

    const auto text = read(file);
    EXPECT_EQ(text.rfind("# " + gw::util::dateString(clock.now()), 0), 0u);
    EXPECT_EQ(occurrences(text, "## Watchdog Events"), 1u);
    EXPECT_NE(text.find("- [" + gw::util::clockString(clock.now()) + "] 🐕 Watchdog started"), std::string::npos);
}

TEST_F(JournalTest, AppendsWithoutRepeatingHeading) {
    const Journal j(dir, clock);
    ASSERT_TRUE(j.append("first"));
    ASSERT_TRUE(j.append("second"));

    const auto text = read(j.fileFor(clock.now()));
    EXPECT_EQ(occurrences(text, "## Watchdog Events"), 1u);
    EXPECT_LT(text.find("first"), text.find("second"));
}

TEST_F(JournalTest, AddsHeadingToExistingNotes) {
    fs::create_directories(dir);
    const Journal j(dir, clock);
    {
        std::ofstream out(j.fileFor(clock.now()));
        out << "# Daily notes\n\nsomething the gateway wrote\n";
    }

    ASSERT_TRUE(j.append("⚙️ Config file changed"));

    const auto text = read(j.fileFor(clock.now()));
    EXPECT_EQ(text.rfind("# Daily notes", 0), 0u);
    EXPECT_EQ(occurrences(text, "## Watchdog Events"), 1u);
    EXPECT_LT(text.find("something the gateway wrote"), text.find("## Watchdog Events"));
}

TEST_F(JournalTest, StripsUnsafeCharacters) {
    const Journal j(dir, clock);
    ASSERT_TRUE(j.append("🚨 [warning] $(whoami) done"));

    const auto text = read(j.fileFor(clock.now()));
    EXPECT_NE(text.find("🚨 warning whoami done"), std::string::npos);
    EXPECT_EQ(text.find("$("), std::string::npos);
}

TEST_F(JournalTest, NewDayStartsNewFile) {
    const Journal j(dir, clock);
    ASSERT_TRUE(j.append("today"));
    const auto first = j.fileFor(clock.now());

    clock.advance(std::chrono::hours(24));
    ASSERT_TRUE(j.append("tomorrow"));
    const auto second = j.fileFor(clock.now());

    EXPECT_NE(first, second);
    EXPECT_EQ(read(first).find("tomorrow"), std::string::npos);
    EXPECT_NE(read(second).find("tomorrow"), std::string::npos);
}

TEST_F(JournalTest, UnwritableDirectoryReportsFailure) {
    fs::create_directories(dir.parent_path());
    { std::ofstream blocker(dir); blocker << "not a directory"; }

    const Journal j(dir, clock);
    EXPECT_FALSE(j.append("lost"));
}
