#pragma once

#include <chrono>
#include <string>

namespace gw::util {

struct HttpResponse {
    bool connected = false;          // a response (any status) was received
    long status = 0;
    std::string body;
    std::string error;
    std::chrono::milliseconds elapsed{0};
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) override;
};

std::string joinUrl(const std::string& base, const std::string& path);

}
