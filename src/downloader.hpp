#pragma once

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string effective_url;
};

// Initializes libcurl for the lifetime of the process
class CurlGlobalInitializer {
public:
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// Follows redirects. HTTP error statuses are returned, transport failures and
// timeouts throw UpstreamUnreachable.
HttpResponse http_get(const std::string& url, long timeout_seconds);
