#pragma once

#include <string>

namespace gw::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Shown in pool diagnostics
    [[nodiscard]] virtual std::string describe() const { return "task"; }
};

}
