#pragma once

#include <chrono>
#include <string>

namespace taskwarden::net {

class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    // True when a plain GET to url answers with a status in [200, 500).
    // Connection failures and timeouts count as "not ready".
    virtual bool ping(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

class CurlHealthProbe : public HealthProbe {
public:
    CurlHealthProbe();
    ~CurlHealthProbe() override;

    CurlHealthProbe(const CurlHealthProbe&) = delete;
    CurlHealthProbe& operator=(const CurlHealthProbe&) = delete;

    bool ping(const std::string& url, std::chrono::milliseconds timeout) override;
};

inline bool is_ready_status(const long status) {
    return status >= 200 && status < 500;
}

}  // namespace taskwarden::net
