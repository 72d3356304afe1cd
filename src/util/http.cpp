#include "util/http.hpp"
#include "util/curlWrappers.hpp"

#include <mutex>

namespace gw::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::get(const std::string& url, const std::chrono::milliseconds timeout) {
    const auto start = std::chrono::steady_clock::now();

    const auto r = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    });

    HttpResponse resp;
    resp.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    resp.status = r.http;
    resp.body = r.body;
    // A transfer that timed out after the status line still counts as "connected"
    resp.connected = r.curl == CURLE_OK || r.http != 0;
    if (r.curl != CURLE_OK) resp.error = curl_easy_strerror(r.curl);
    return resp;
}

std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    const bool baseSlash = base.back() == '/';
    const bool pathSlash = path.front() == '/';
    if (baseSlash && pathSlash) return base + path.substr(1);
    if (!baseSlash && !pathSlash) return base + "/" + path;
    return base + path;
}

}
