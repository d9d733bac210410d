// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/endpoint_prober.hpp>
#include <uplink/core/config.hpp>
#include <uplink/core/log.hpp>
#include <curl/curl.h>

namespace uplink::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

} // namespace

CurlProber::ProbeResult CurlProber::probe(const std::string& url, std::chrono::milliseconds timeout) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(UplinkErrc::network_error));
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);  // Probes run on worker threads
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    auto start = std::chrono::steady_clock::now();
    CURLcode result = curl_easy_perform(curl.ptr);
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    if (result == CURLE_OPERATION_TIMEDOUT) {
        log::get("probe")->debug("{} timed out after {:.0f} ms", url, elapsed);
        return std::unexpected(make_error_code(UplinkErrc::probe_timeout));
    }
    if (result != CURLE_OK) {
        log::get("probe")->debug("{} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(make_error_code(UplinkErrc::probe_failed));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    // Any answer below 500 proves the endpoint is up
    if (http_code >= 500) {
        log::get("probe")->debug("{} answered HTTP {}", url, http_code);
        return std::unexpected(make_error_code(UplinkErrc::probe_failed));
    }

    return elapsed;
}

CurlGlobal::CurlGlobal()
    : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {
    if (!ok_) {
        log::get("probe")->error("libcurl initialization failed");
    }
}

CurlGlobal::~CurlGlobal() {
    if (ok_) {
        curl_global_cleanup();
    }
}

} // namespace uplink::core
