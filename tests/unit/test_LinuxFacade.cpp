#include <gtest/gtest.h>
#include "os/LinuxFacade.hpp"
#include "util/files.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>

#include <unistd.h>

using gw::os::LinuxFacade;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class LinuxFacadeTest : public ::testing::Test {
protected:
    LinuxFacade os{"SIGUSR1", {"sh", "-c", "test \"$0\" = gw.service", "{service}"}, 5s};
};

TEST_F(LinuxFacadeTest, SignalNames) {
    EXPECT_EQ(LinuxFacade::signalFromName("SIGUSR1"), SIGUSR1);
    EXPECT_EQ(LinuxFacade::signalFromName("usr2"), SIGUSR2);
    EXPECT_EQ(LinuxFacade::signalFromName("HUP"), SIGHUP);
    EXPECT_EQ(LinuxFacade::signalFromName("15"), 15);
    EXPECT_THROW(LinuxFacade::signalFromName("SIGNOPE"), std::invalid_argument);
}

TEST_F(LinuxFacadeTest, RejectsEmptyRestartCommand) {
    EXPECT_THROW(LinuxFacade("SIGUSR1", {}, 5s), std::invalid_argument);
    EXPECT_THROW(LinuxFacade("SIGWHAT", {"true"}, 5s), std::invalid_argument);
}

TEST_F(LinuxFacadeTest, MountFieldsAreUnescaped) {
    EXPECT_EQ(LinuxFacade::unescapeMountField("/mnt/my\\040drive"), "/mnt/my drive");
    EXPECT_EQ(LinuxFacade::unescapeMountField("/mnt/tab\\011x"), "/mnt/tab\tx");
    EXPECT_EQ(LinuxFacade::unescapeMountField("/mnt/plain"), "/mnt/plain");
    EXPECT_EQ(LinuxFacade::unescapeMountField("/mnt/trail\\04"), "/mnt/trail\\04");
}

TEST_F(LinuxFacadeTest, RootIsMounted) {
    EXPECT_TRUE(os.isVolumeMounted("/"));
    EXPECT_FALSE(os.isVolumeMounted("/definitely/not/a/mount/point"));
}

TEST_F(LinuxFacadeTest, DiskUsageIsAPercentage) {
    const auto usage = os.diskUsagePercent("/");
    ASSERT_TRUE(usage.has_value());
    EXPECT_GE(*usage, 0.0);
    EXPECT_LE(*usage, 100.0);

    EXPECT_FALSE(os.diskUsagePercent("/definitely/not/here").has_value());
}

TEST_F(LinuxFacadeTest, CommandExitCodes) {
    EXPECT_TRUE(os.runCommand({"true"}, 5s).ok());

    const auto failed = os.runCommand({"false"}, 5s);
    EXPECT_TRUE(failed.launched);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.exit_code, 1);

    const auto missing = os.runCommand({"gatewatch-no-such-binary"}, 5s);
    EXPECT_FALSE(missing.launched);
    EXPECT_FALSE(missing.ok());

    EXPECT_FALSE(os.runCommand({}, 5s).launched);
}

TEST_F(LinuxFacadeTest, CommandTimeoutKillsChild) {
    const auto start = std::chrono::steady_clock::now();
    const auto r = os.runCommand({"sleep", "30"}, 1s);

    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST_F(LinuxFacadeTest, SupervisorRestartSubstitutesServiceId) {
    EXPECT_TRUE(os.runSupervisorRestart("gw.service").ok());
    EXPECT_FALSE(os.runSupervisorRestart("other.service").ok());
}

TEST_F(LinuxFacadeTest, OwnershipOfOwnFiles) {
    const auto file = fs::temp_directory_path() / ("gatewatch-owner-" + gw::util::generate_random_suffix());
    { std::ofstream out(file); out << "x"; }

    EXPECT_EQ(os.currentUid(), static_cast<unsigned int>(::geteuid()));
    EXPECT_EQ(os.ownerOf(file), os.currentUid());
    EXPECT_TRUE(os.ownedByCurrentUser(file));

    fs::remove(file);
    EXPECT_FALSE(os.ownerOf(file).has_value());
    EXPECT_FALSE(os.ownedByCurrentUser(file));
}

TEST_F(LinuxFacadeTest, ProcessLookup) {
    EXPECT_FALSE(os.findProcess("").has_value());
    EXPECT_FALSE(os.findProcess("gatewatch-no-such-process-7f3a").has_value());
    EXPECT_FALSE(os.sendGracefulSignal(0));
}
