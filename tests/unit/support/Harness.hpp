#pragma once

#include "alert/Dispatcher.hpp"
#include "alert/Journal.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "health/MemoryTrendTracker.hpp"
#include "health/Probe.hpp"
#include "log/Rotator.hpp"
#include "metrics/Publisher.hpp"
#include "recovery/Controller.hpp"
#include "runtime/Bootstrap.hpp"
#include "runtime/Context.hpp"
#include "runtime/MonitorLoop.hpp"
#include "snapshot/Manager.hpp"
#include "state/Store.hpp"
#include "util/files.hpp"

#include "support/FakeFacade.hpp"
#include "support/FakeHttp.hpp"
#include "support/ManualClock.hpp"
#include "support/RecordingSink.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace gw::test {

// The full component graph wired to fakes, rooted in a private temp directory.
struct Harness {
    std::filesystem::path root;
    std::vector<std::string> events;

    config::Config cfg;
    ManualClock clock;
    FakeFacade os{events};
    FakeHttp http{events};
    concurrency::ThreadPool pool{1, 8};
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();

    std::unique_ptr<alert::Journal> journal;
    std::unique_ptr<alert::Dispatcher> alerts;
    std::unique_ptr<snapshot::Manager> snapshots;
    std::unique_ptr<health::Probe> probe;
    std::unique_ptr<health::MemoryTrendTracker> tracker;
    std::unique_ptr<recovery::Controller> recovery;
    std::unique_ptr<state::Store> store;
    std::unique_ptr<metrics::Publisher> publisher;
    std::unique_ptr<log::Rotator> rotator;
    std::unique_ptr<runtime::Bootstrap> bootstrap;
    std::unique_ptr<runtime::MonitorLoop> loop;

    runtime::Context ctx;

    static constexpr const char* ROOT_URL = "http://gw.test/";
    static constexpr const char* SESSIONS_URL = "http://gw.test/api/sessions";
    static constexpr const char* JOBS_URL = "http://gw.test/api/cron/status";
    static constexpr const char* UPSTREAM_URL = "https://upstream.test";

    Harness() {
        namespace fs = std::filesystem;
        root = fs::temp_directory_path() / ("gatewatch-test-" + util::generate_random_suffix());
        fs::create_directories(root);

        cfg.gateway.url = "http://gw.test";
        cfg.gateway.workspace_dir = root / "gateway";
        cfg.gateway.config_file = root / "gateway" / "openclaw.json";
        cfg.gateway.error_log = root / "gateway" / "stderr.log";
        cfg.gateway.memory_dir = root / "gateway" / "workspace" / "memory";
        cfg.upstream.url = UPSTREAM_URL;
        cfg.backup.volume = root / "backup";
        cfg.storage.data_dir = root / "data";

        fs::create_directories(cfg.gateway.memory_dir);
        fs::create_directories(cfg.storage.data_dir);
        fs::create_directories(cfg.backup.volume);
        writeFile(cfg.gateway.memory_dir / "notes.md", "# notes\n");
        writeFile(cfg.gateway.config_file, R"({"gateway": {"port": 18789}})");

        journal = std::make_unique<alert::Journal>(cfg.gateway.memory_dir, clock);
        alerts = std::make_unique<alert::Dispatcher>(cfg.alerts, clock, *journal, pool);
        alerts->addLocalSink(sink);
        snapshots = std::make_unique<snapshot::Manager>(cfg, http, os, clock, *alerts, *journal);
        probe = std::make_unique<health::Probe>(cfg, os, http, clock, *alerts, *snapshots, *journal);
        tracker = std::make_unique<health::MemoryTrendTracker>(cfg.thresholds);
        recovery = std::make_unique<recovery::Controller>(cfg, os, *probe, *snapshots, *alerts, *journal, clock);
        store = std::make_unique<state::Store>(cfg.storage.stateFile(), os);
        publisher = std::make_unique<metrics::Publisher>(cfg.storage.metricsFile());

        log::Rotator::Options ro;
        ro.active_path = cfg.storage.data_dir / "loop.log";
        ro.max_bytes = cfg.logging.max_size_bytes;
        ro.keep = cfg.logging.keep;
        rotator = std::make_unique<log::Rotator>(std::move(ro));

        bootstrap = std::make_unique<runtime::Bootstrap>(cfg, runtime::Bootstrap::Components{
            os, *alerts, *journal, *store
        });
        loop = std::make_unique<runtime::MonitorLoop>(cfg, clock, runtime::MonitorLoop::Components{
            *probe, *tracker, *recovery, *alerts, *store, *publisher, *rotator
        });
    }

    ~Harness() {
        pool.stop();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    // Process present, HTTP 200, upstream answering, nothing scheduled failing
    void healthyGateway(const unsigned long memoryMb = 300) {
        os.process = os::ProcessInfo{4242, memoryMb, 2.5};
        http.set(ROOT_URL, httpStatus(200));
        http.set(UPSTREAM_URL, httpStatus(404));
        http.set(SESSIONS_URL, httpStatus(200, R"([{"id": "s1"}])"));
        http.set(JOBS_URL, httpStatus(200, R"({"jobs": []})"));
    }

    void writeBackup(const std::string& name, const std::string& content) const {
        const auto dir = cfg.backup.configBackupDir();
        std::filesystem::create_directories(dir);
        writeFile(dir / name, content);
    }

    [[nodiscard]] size_t countEvents(const std::string& e) const {
        size_t n = 0;
        for (const auto& ev : events) if (ev == e) ++n;
        return n;
    }

    [[nodiscard]] std::string journalText() const {
        std::ifstream in(journal->fileFor(clock.now()));
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static void writeFile(const std::filesystem::path& p, const std::string& content) {
        std::ofstream out(p, std::ios::trunc);
        out << content;
    }
};

}
