#include "net/health_probe.hpp"

#include <curl/curl.h>
#include <mutex>

namespace taskwarden::net {

namespace {

size_t discard_body(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

std::once_flag g_curl_init;

}  // namespace

CurlHealthProbe::CurlHealthProbe() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHealthProbe::~CurlHealthProbe() = default;

bool CurlHealthProbe::ping(const std::string& url,
                           const std::chrono::milliseconds timeout) {
    CurlHandle c;
    if (!c.h) {
        return false;
    }
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(c.h, CURLOPT_NOPROXY, "*");
    const CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        return false;
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    return is_ready_status(status);
}

}  // namespace taskwarden::net
