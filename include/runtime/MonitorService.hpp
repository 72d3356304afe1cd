#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "runtime/Clock.hpp"
#include "runtime/Context.hpp"

#include <memory>

namespace gw::os { class Facade; }
namespace gw::util { class HttpClient; }
namespace gw::concurrency { class ThreadPool; }
namespace gw::alert { class Journal; class Dispatcher; }
namespace gw::snapshot { class Manager; }
namespace gw::health { class Probe; class MemoryTrendTracker; }
namespace gw::recovery { class Controller; }
namespace gw::state { class Store; }
namespace gw::metrics { class Publisher; }
namespace gw::log { class Rotator; }

namespace gw::runtime {

class Bootstrap;
class MonitorLoop;

// Hosts the monitor loop on its own thread and owns every component it drives.
class MonitorService final : public concurrency::AsyncService {
public:
    MonitorService(const config::Config& cfg, std::shared_ptr<os::Facade> os,
                   std::shared_ptr<util::HttpClient> http, concurrency::ThreadPool& remotePool);

    ~MonitorService() override;

protected:
    void runLoop() override;

private:
    const config::Config& cfg_;
    std::shared_ptr<os::Facade> os_;
    std::shared_ptr<util::HttpClient> http_;

    SystemClock clock_;
    Context ctx_;

    std::unique_ptr<alert::Journal> journal_;
    std::unique_ptr<alert::Dispatcher> alerts_;
    std::unique_ptr<snapshot::Manager> snapshots_;
    std::unique_ptr<health::Probe> probe_;
    std::unique_ptr<health::MemoryTrendTracker> tracker_;
    std::unique_ptr<recovery::Controller> recovery_;
    std::unique_ptr<state::Store> store_;
    std::unique_ptr<metrics::Publisher> publisher_;
    std::unique_ptr<log::Rotator> rotator_;
    std::unique_ptr<Bootstrap> bootstrap_;
    std::unique_ptr<MonitorLoop> loop_;
};

}
