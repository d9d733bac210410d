// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/concurrency_controller.hpp>
#include <uplink/core/endpoint_selector.hpp>
#include <uplink/core/error.hpp>
#include <uplink/core/parameter_adjuster.hpp>
#include <uplink/core/telemetry_analyzer.hpp>
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

namespace uplink::core {

// Everything an uploader session is built from.
// Missing keys keep their defaults; out-of-range values are clamped.
struct SessionConfig {
    TelemetryConfig telemetry;
    ConcurrencyConfig concurrency;
    AdjusterConfig adjuster;
    SelectorConfig selector;
    std::vector<EndpointCandidate> endpoints;

    [[nodiscard]] static std::expected<SessionConfig, std::error_code> parse(std::string_view json) noexcept;
    [[nodiscard]] static std::expected<SessionConfig, std::error_code> load(const std::filesystem::path& path) noexcept;

    [[nodiscard]] SessionConfig sanitized() const;
};

} // namespace uplink::core
