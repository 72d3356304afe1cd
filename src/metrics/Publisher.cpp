#include "metrics/Publisher.hpp"
#include "health/Snapshot.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

using namespace gw::metrics;

Publisher::Publisher(std::filesystem::path file)
    : file_(std::move(file)) {}

void Publisher::publish(const health::HealthSnapshot& snapshot) const {
    const nlohmann::json j = snapshot;
    util::atomicWrite(file_, j.dump(4), util::WORLD_READABLE);
}
