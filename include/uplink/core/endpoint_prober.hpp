// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/error.hpp>
#include <chrono>
#include <expected>
#include <string>

namespace uplink::core {

// Lightweight liveness check against one endpoint
class EndpointProber {
public:
    using ProbeResult = std::expected<double, std::error_code>; // round trip in ms

    virtual ~EndpointProber() = default;

    // Must return within roughly `timeout`; may be called from several threads at once
    [[nodiscard]] virtual ProbeResult probe(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

// HEAD request through libcurl
class CurlProber final : public EndpointProber {
public:
    [[nodiscard]] ProbeResult probe(const std::string& url, std::chrono::milliseconds timeout) override;
};

// Process-wide libcurl setup, held for the lifetime of the guard.
// Create one before any CurlProber runs; guards may nest.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

private:
    bool ok_;
};

} // namespace uplink::core
