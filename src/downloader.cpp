#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <memory>

namespace {

// HTTP body callback
size_t write_data_cpp(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // anonymous namespace

CurlGlobalInitializer::CurlGlobalInitializer() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw PipkinException(get_string("error.curl_init_failed"));
    }
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

HttpResponse http_get(const std::string& url, long timeout_seconds) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw UpstreamUnreachable(string_format("error.download_failed", url));
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data_cpp);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // proxy handlers run on worker threads
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pipkin");

    log_debug(string_format("debug.http_get", url));
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw UpstreamUnreachable(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* effective = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? effective : url;
    return response;
}
