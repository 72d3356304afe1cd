#pragma once

#include "alert/Sink.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace gw::test {

class RecordingSink final : public alert::Sink {
public:
    explicit RecordingSink(std::string name = "recording") : name_(std::move(name)) {}

    [[nodiscard]] std::string name() const override { return name_; }

    void deliver(const alert::Notification& n) override {
        std::scoped_lock lock(mutex_);
        received_.push_back(n);
        if (fail) throw std::runtime_error("sink unavailable");
    }

    [[nodiscard]] std::vector<alert::Notification> received() const {
        std::scoped_lock lock(mutex_);
        return received_;
    }

    [[nodiscard]] size_t count(const std::string& type) const {
        std::scoped_lock lock(mutex_);
        size_t n = 0;
        for (const auto& r : received_) if (r.type == type) ++n;
        return n;
    }

    [[nodiscard]] bool has(const std::string& type) const { return count(type) > 0; }

    bool fail = false;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<alert::Notification> received_;
};

}
