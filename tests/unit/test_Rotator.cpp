#include <gtest/gtest.h>
#include "log/Rotator.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using gw::log::Rotator;

class RotatorTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path active;
    int reopened = 0;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("gatewatch-rotator-" + gw::util::generate_random_suffix());
        fs::create_directories(dir);
        active = dir / "watchdog.log";
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    Rotator make(const std::uint64_t maxBytes, const unsigned int keep) {
        Rotator::Options o;
        o.active_path = active;
        o.max_bytes = maxBytes;
        o.keep = keep;
        o.on_reopen = [this] {
            ++reopened;
            std::ofstream touch(active, std::ios::app);
        };
        return Rotator(std::move(o));
    }

    void writeActive(const std::string& marker, const size_t bytes) const {
        std::ofstream out(active, std::ios::trunc);
        out << marker << std::string(bytes, 'x');
    }

    static std::string firstLine(const fs::path& p) {
        std::ifstream in(p);
        std::string line;
        std::getline(in, line);
        return line;
    }
};

TEST_F(RotatorTest, LeavesSmallFileAlone) {
    const auto r = make(1024, 5);
    writeActive("small\n", 100);

    EXPECT_FALSE(r.maybeRotate());
    EXPECT_TRUE(fs::exists(active));
    EXPECT_FALSE(fs::exists(r.rotatedPath(1)));
    EXPECT_EQ(reopened, 0);
}

TEST_F(RotatorTest, RotatesOversizedFileAndReopens) {
    const auto r = make(1024, 5);
    writeActive("first\n", 2048);

    EXPECT_TRUE(r.maybeRotate());
    EXPECT_EQ(firstLine(r.rotatedPath(1)), "first");
    EXPECT_TRUE(fs::exists(active));
    EXPECT_EQ(fs::file_size(active), 0u);
    EXPECT_EQ(reopened, 1);

    const auto perms = fs::status(active).permissions();
    EXPECT_EQ(perms & fs::perms::all, gw::util::OWNER_ONLY);
}

TEST_F(RotatorTest, KeepsOnlyConfiguredHistory) {
    const auto r = make(10, 3);

    for (int i = 1; i <= 5; ++i) {
        writeActive("gen" + std::to_string(i) + "\n", 64);
        ASSERT_TRUE(r.maybeRotate());
    }

    EXPECT_EQ(firstLine(r.rotatedPath(1)), "gen5");
    EXPECT_EQ(firstLine(r.rotatedPath(2)), "gen4");
    EXPECT_EQ(firstLine(r.rotatedPath(3)), "gen3");
    EXPECT_FALSE(fs::exists(r.rotatedPath(4)));
}

TEST_F(RotatorTest, RejectsEmptyPath) {
    EXPECT_THROW({ Rotator r(Rotator::Options{}); }, std::invalid_argument);
}
