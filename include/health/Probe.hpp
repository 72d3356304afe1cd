#pragma once

#include "config/Config.hpp"
#include "os/Facade.hpp"
#include "runtime/Clock.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace gw::util { class HttpClient; }
namespace gw::alert { class Dispatcher; class Journal; }
namespace gw::snapshot { class Manager; }
namespace gw::runtime { struct Context; }

namespace gw::health {

enum class ConfigStatus { Valid, Changed, Missing, Invalid };

struct HttpCheck {
    bool healthy = false;
    long status = 0;
    std::chrono::milliseconds latency{0};
};

// The individual checks. Each one catches its own failures and reports them as a negative reading;
// alerts that belong to a check are raised by the check itself.
class Probe {
public:
    Probe(const config::Config& cfg, os::Facade& os, util::HttpClient& http, const runtime::Clock& clock,
          alert::Dispatcher& alerts, snapshot::Manager& snapshots, const alert::Journal& journal);

    // Percent of the root volume in use; nullopt if it could not be read
    std::optional<unsigned int> checkDisk(runtime::Context& ctx);

    bool checkBackupVolume(runtime::Context& ctx);

    // Invalid and Missing trigger a restore from backup before returning
    ConfigStatus checkConfig(runtime::Context& ctx);

    std::optional<os::ProcessInfo> checkProcess();

    // Healthy means HTTP 200 within the timeout. Records latency and raises response_slow.
    HttpCheck checkHttp(runtime::Context& ctx);

    // Any response at all counts as reachable
    bool checkUpstream();

    // Error lines in the tail of the gateway's stderr log; 0 when the log is absent or stale
    unsigned int checkErrorDensity(runtime::Context& ctx);

    // Names of scheduled jobs whose last run failed
    std::vector<std::string> checkJobs(runtime::Context& ctx);

    static bool isErrorLine(const std::string& line);

private:
    const config::Config& cfg_;
    os::Facade& os_;
    util::HttpClient& http_;
    const runtime::Clock& clock_;
    alert::Dispatcher& alerts_;
    snapshot::Manager& snapshots_;
    const alert::Journal& journal_;

    void recordLatency(std::chrono::milliseconds latency) const;
};

}
