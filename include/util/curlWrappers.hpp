#pragma once

#include <curl/curl.h>
#include <stdexcept>
#include <string>

namespace gw::util {

void ensureCurlGlobalInit();

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

struct CurlResult {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
};

template <class SetupFn>
CurlResult performCurl(SetupFn&& setup) {
    ensureCurlGlobalInit();
    CurlEasy h;                    // RAII handle
    std::string bodyBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, +[](char* p, size_t s, size_t n, void* ud) {
        auto* buf = static_cast<std::string*>(ud);
        buf->append(p, s * n);
        return s * n;
    });
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &bodyBuf);

    setup(h);                      // caller-specific tweaks

    CurlResult r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    r.body.swap(bodyBuf);
    return r;
}

}
