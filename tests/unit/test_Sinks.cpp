#include <gtest/gtest.h>
#include "alert/DesktopSink.hpp"
#include "alert/RemoteSink.hpp"

#include "support/FakeFacade.hpp"

using namespace gw;
using namespace std::chrono_literals;
using alert::Notification;
using alert::Severity;

class SinkTest : public ::testing::Test {
protected:
    std::vector<std::string> events;
    test::FakeFacade os{events};
    std::shared_ptr<test::FakeFacade> remoteOs = std::make_shared<test::FakeFacade>(events);
    config::DesktopAlertConfig desktop;
    config::RemoteAlertConfig remote;

    static Notification note(const Severity s, std::string msg = "Disk 91% full") {
        return Notification{"disk_critical", std::move(msg), s, std::chrono::system_clock::now()};
    }
};

TEST_F(SinkTest, DesktopCriticalUsesCriticalUrgencyAndSound) {
    const alert::DesktopSink sink(desktop, os, 5s);

    EXPECT_EQ(sink.buildCommand(note(Severity::Critical)), (std::vector<std::string>{
        "notify-send", "-u", "critical", "-h", "string:sound-name:dialog-error",
        "Watchdog [critical]", "Disk 91% full"
    }));
}

TEST_F(SinkTest, DesktopWarningAndInfoUrgency) {
    const alert::DesktopSink sink(desktop, os, 5s);

    const auto warn = sink.buildCommand(note(Severity::Warning));
    EXPECT_EQ(warn[2], "normal");
    EXPECT_EQ(warn[4], "string:sound-name:dialog-warning");

    EXPECT_EQ(sink.buildCommand(note(Severity::Info))[2], "low");
}

TEST_F(SinkTest, DesktopDeliveryFailureThrows) {
    alert::DesktopSink sink(desktop, os, 5s);

    EXPECT_NO_THROW(sink.deliver(note(Severity::Warning)));
    ASSERT_EQ(os.commands.size(), 1u);
    EXPECT_EQ(os.commands[0].front(), "notify-send");

    os.commandResult = os::CommandResult{false, false, 127};
    EXPECT_THROW(sink.deliver(note(Severity::Warning)), std::runtime_error);

    os.commandResult = os::CommandResult{true, true, -1};
    EXPECT_THROW(sink.deliver(note(Severity::Warning)), std::runtime_error);
}

TEST_F(SinkTest, RemoteSubstitutesDecoratedMessage) {
    const alert::RemoteSink sink(remote, remoteOs);

    const auto argv = sink.buildCommand(note(Severity::Critical, "Gateway down"));
    EXPECT_EQ(argv, (std::vector<std::string>{
        "openclaw", "message", "send", "--channel", "slack", "--message",
        "[critical] Watchdog: Gateway down", "--best-effort"
    }));
}

TEST_F(SinkTest, RemoteNonZeroExitThrows) {
    alert::RemoteSink sink(remote, remoteOs);
    remoteOs->commandResult = os::CommandResult{true, false, 2};

    EXPECT_THROW(sink.deliver(note(Severity::Warning)), std::runtime_error);
    ASSERT_EQ(remoteOs->commands.size(), 1u);
    EXPECT_EQ(remoteOs->commands[0].front(), "openclaw");
}

TEST_F(SinkTest, RemoteRejectsEmptyCommand) {
    remote.command.clear();
    EXPECT_THROW(alert::RemoteSink(remote, remoteOs), std::invalid_argument);
    remote = config::RemoteAlertConfig{};
    EXPECT_THROW(alert::RemoteSink(remote, nullptr), std::invalid_argument);
}

TEST_F(SinkTest, RemoteSinkKeepsFacadeAliveForQueuedDeliveries) {
    auto* facade = remoteOs.get();
    alert::RemoteSink sink(remote, std::move(remoteOs));

    EXPECT_NO_THROW(sink.deliver(note(Severity::Critical, "Gateway down")));
    ASSERT_EQ(facade->commands.size(), 1u);
    EXPECT_EQ(facade->commands[0][6], "[critical] Watchdog: Gateway down");
}
