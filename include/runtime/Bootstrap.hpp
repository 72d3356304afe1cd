#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace gw::os { class Facade; }
namespace gw::alert { class Dispatcher; class Journal; }
namespace gw::state { class Store; }

namespace gw::runtime {

struct Context;

// One-time startup before the first cycle: storage directories, ownership checks,
// resumed state, startup alert.
class Bootstrap {
public:
    struct Components {
        os::Facade& os;
        alert::Dispatcher& alerts;
        alert::Journal& journal;
        state::Store& store;
    };

    Bootstrap(const config::Config& cfg, Components parts);

    // Never throws for a bad host; problems become alerts and the loop starts anyway.
    void run(Context& ctx);

private:
    const config::Config& cfg_;
    Components parts_;

    bool prepareDirectories(Context& ctx);
    void verifyOwnership(Context& ctx, const std::filesystem::path& file);
};

}
