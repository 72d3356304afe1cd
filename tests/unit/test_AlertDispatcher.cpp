#include <gtest/gtest.h>
#include "log/Registry.hpp"
#include "support/Harness.hpp"

#include <fstream>
#include <sstream>

using namespace gw;
using namespace std::chrono_literals;
using gw::alert::Severity;

class AlertDispatcherTest : public ::testing::Test {
protected:
    test::Harness h;

    static std::string mainLog() {
        log::Registry::alert()->flush();
        std::ifstream in(log::Registry::mainLogPath());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(AlertDispatcherTest, FirstAlertFiresAndRepeatIsSuppressed) {
    EXPECT_TRUE(h.alerts->notify(h.ctx, "disk_warning", "Disk 85% full", Severity::Warning));
    h.clock.advance(60s);
    EXPECT_FALSE(h.alerts->notify(h.ctx, "disk_warning", "Disk 86% full", Severity::Warning));

    EXPECT_EQ(h.sink->count("disk_warning"), 1u);
    EXPECT_TRUE(h.alerts->inCooldown(h.ctx, "disk_warning"));
}

TEST_F(AlertDispatcherTest, CooldownIsPerType) {
    EXPECT_TRUE(h.alerts->notify(h.ctx, "disk_warning", "Disk 85% full", Severity::Warning));
    EXPECT_TRUE(h.alerts->notify(h.ctx, "memory_warning", "High memory: 1600MB", Severity::Warning));

    EXPECT_EQ(h.sink->received().size(), 2u);
    EXPECT_FALSE(h.alerts->inCooldown(h.ctx, "backup_drive"));
}

TEST_F(AlertDispatcherTest, FiresAgainOnceCooldownElapses) {
    ASSERT_TRUE(h.alerts->notify(h.ctx, "disk_warning", "first", Severity::Warning));

    h.clock.advance(h.cfg.alerts.cooldown - 1s);
    EXPECT_FALSE(h.alerts->notify(h.ctx, "disk_warning", "second", Severity::Warning));

    h.clock.advance(1s);
    EXPECT_TRUE(h.alerts->notify(h.ctx, "disk_warning", "third", Severity::Warning));

    const auto got = h.sink->received();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got.back().message, "third");
}

TEST_F(AlertDispatcherTest, SuppressedAlertDoesNotRefreshLedger) {
    ASSERT_TRUE(h.alerts->notify(h.ctx, "error_rate", "a", Severity::Warning));
    const auto stamped = h.ctx.alerts.at("error_rate");

    h.clock.advance(10min);
    EXPECT_FALSE(h.alerts->notify(h.ctx, "error_rate", "b", Severity::Warning));
    EXPECT_EQ(h.ctx.alerts.at("error_rate"), stamped);
}

TEST_F(AlertDispatcherTest, SanitizesTypeAndMessage) {
    ASSERT_TRUE(h.alerts->notify(h.ctx, "cron_failed", "job `rm -rf /`; $(reboot) \"quoted\"", Severity::Warning));

    const auto got = h.sink->received();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].message, "job rm -rf / reboot quoted");
    EXPECT_EQ(got[0].severity, Severity::Warning);
}

TEST_F(AlertDispatcherTest, JournalsFiredAlertsOnly) {
    ASSERT_TRUE(h.alerts->notify(h.ctx, "backup_drive", "Backup drive not mounted!", Severity::Critical));
    ASSERT_FALSE(h.alerts->notify(h.ctx, "backup_drive", "Backup drive not mounted!", Severity::Critical));

    const auto text = h.journalText();
    EXPECT_NE(text.find("## Watchdog Events"), std::string::npos);

    size_t hits = 0;
    for (auto pos = text.find("🚨 critical Backup drive not mounted!"); pos != std::string::npos;
         pos = text.find("🚨 critical Backup drive not mounted!", pos + 1))
        ++hits;
    EXPECT_EQ(hits, 1u);
}

TEST_F(AlertDispatcherTest, WritesAlertLineToMainLog) {
    ASSERT_TRUE(h.alerts->notify(h.ctx, "dispatcher_log_probe", "visible in log", Severity::Critical));

    const auto log = mainLog();
    EXPECT_NE(log.find("[ALERT] [critical] dispatcher_log_probe: visible in log"), std::string::npos);
}

TEST_F(AlertDispatcherTest, FailingSinkDoesNotStopOthers) {
    const auto broken = std::make_shared<test::RecordingSink>("broken");
    broken->fail = true;
    const auto healthy = std::make_shared<test::RecordingSink>("after");

    h.alerts->addLocalSink(broken);
    h.alerts->addLocalSink(healthy);

    EXPECT_NO_THROW({
        EXPECT_TRUE(h.alerts->notify(h.ctx, "gateway_down", "Gateway down!", Severity::Critical));
    });

    EXPECT_EQ(broken->count("gateway_down"), 1u);
    EXPECT_EQ(healthy->count("gateway_down"), 1u);
    EXPECT_TRUE(h.alerts->inCooldown(h.ctx, "gateway_down"));
}

TEST_F(AlertDispatcherTest, RemoteSinksRunOnPool) {
    const auto remote = std::make_shared<test::RecordingSink>("remote");
    h.alerts->addRemoteSink(remote);

    ASSERT_TRUE(h.alerts->notify(h.ctx, "recovery", "Gateway recovered after hard restart", Severity::Success));
    h.pool.stop();

    EXPECT_EQ(remote->count("recovery"), 1u);
    EXPECT_EQ(h.sink->count("recovery"), 1u);
}

TEST_F(AlertDispatcherTest, RemoteDropStillFiresLocally) {
    const auto remote = std::make_shared<test::RecordingSink>("remote");
    h.alerts->addRemoteSink(remote);
    h.pool.stop();

    EXPECT_TRUE(h.alerts->notify(h.ctx, "disk_critical", "Disk 97% full", Severity::Critical));
    EXPECT_EQ(remote->count("disk_critical"), 0u);
    EXPECT_EQ(h.sink->count("disk_critical"), 1u);
}

TEST_F(AlertDispatcherTest, RejectsNullSink) {
    EXPECT_THROW(h.alerts->addLocalSink(nullptr), std::invalid_argument);
    EXPECT_THROW(h.alerts->addRemoteSink(nullptr), std::invalid_argument);
}
