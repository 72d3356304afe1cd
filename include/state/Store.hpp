#pragma once

#include "runtime/Clock.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace gw::os { class Facade; }
namespace gw::runtime { struct Context; }

namespace gw::state {

struct PersistedState {
    unsigned int restart_attempts = 0;
    std::optional<long long> last_check;
    unsigned long last_memory_mb = 0;
    std::vector<unsigned long> memory_history;
    std::string config_hash;

    static PersistedState fromContext(const runtime::Context& ctx, runtime::TimePoint now);
    void applyTo(runtime::Context& ctx) const;
};

void to_json(nlohmann::json& j, const PersistedState& s);
void from_json(const nlohmann::json& j, PersistedState& s);

enum class LoadStatus { Loaded, Missing, Untrusted, Corrupt };

struct LoadResult {
    LoadStatus status = LoadStatus::Missing;
    PersistedState state;
};

// Owner-only JSON record of restart counters and the memory window, read once at startup.
class Store {
public:
    Store(std::filesystem::path file, const os::Facade& os);

    [[nodiscard]] LoadResult load() const;

    // Throws std::system_error if the file could not be replaced
    void save(const runtime::Context& ctx, runtime::TimePoint now) const;

    [[nodiscard]] const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    const os::Facade& os_;
};

}
