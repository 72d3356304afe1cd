#pragma once

#include "alert/Alert.hpp"

#include <string>

namespace gw::alert {

class Sink {
public:
    virtual ~Sink() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Throws std::runtime_error when the notification could not be handed off.
    virtual void deliver(const Notification& n) = 0;
};

}
