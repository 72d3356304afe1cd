#pragma once

#include "util/http.hpp"

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace gw::test {

inline util::HttpResponse httpStatus(const long status, std::string body = {},
                                     const std::chrono::milliseconds elapsed = std::chrono::milliseconds(20)) {
    util::HttpResponse r;
    r.connected = true;
    r.status = status;
    r.body = std::move(body);
    r.elapsed = elapsed;
    return r;
}

inline util::HttpResponse httpDown(const std::string& error = "Couldn't connect to server") {
    util::HttpResponse r;
    r.connected = false;
    r.error = error;
    return r;
}

// Per-URL canned responses: queued ones are served first, then the standing one.
class FakeHttp final : public util::HttpClient {
public:
    explicit FakeHttp(std::vector<std::string>& events) : events_(events) {}

    void set(const std::string& url, util::HttpResponse r) { standing_[url] = std::move(r); }
    void queue(const std::string& url, util::HttpResponse r) { queued_[url].push_back(std::move(r)); }

    util::HttpResponse get(const std::string& url, const std::chrono::milliseconds timeout) override {
        events_.push_back("GET " + url);
        requests.emplace_back(url, timeout);

        if (auto q = queued_.find(url); q != queued_.end() && !q->second.empty()) {
            auto r = std::move(q->second.front());
            q->second.pop_front();
            return r;
        }
        if (const auto s = standing_.find(url); s != standing_.end()) return s->second;
        return httpDown();
    }

    [[nodiscard]] size_t count(const std::string& url) const {
        size_t n = 0;
        for (const auto& [u, _] : requests) if (u == url) ++n;
        return n;
    }

    std::vector<std::pair<std::string, std::chrono::milliseconds>> requests;

private:
    std::vector<std::string>& events_;
    std::map<std::string, util::HttpResponse> standing_;
    std::map<std::string, std::deque<util::HttpResponse>> queued_;
};

}
