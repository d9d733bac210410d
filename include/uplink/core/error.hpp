// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace uplink::core {

enum class UplinkErrc {
    success = 0,
    no_available_endpoint,
    probe_failed,
    probe_timeout,
    invalid_url,
    invalid_config,
    config_not_found,
    invalid_trace,
    cancelled,
    network_error,
};

namespace detail {

struct UplinkErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "uplink::core";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<UplinkErrc>(ev)) {
            case UplinkErrc::success:               return "Success";
            case UplinkErrc::no_available_endpoint: return "No available endpoint";
            case UplinkErrc::probe_failed:          return "Endpoint probe failed";
            case UplinkErrc::probe_timeout:         return "Endpoint probe timed out";
            case UplinkErrc::invalid_url:           return "Invalid URL";
            case UplinkErrc::invalid_config:        return "Invalid configuration";
            case UplinkErrc::config_not_found:      return "Configuration file not found";
            case UplinkErrc::invalid_trace:         return "Invalid event trace";
            case UplinkErrc::cancelled:             return "Operation cancelled";
            case UplinkErrc::network_error:         return "Network error";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::UplinkErrcCategory& uplink_errc_category() noexcept {
    static detail::UplinkErrcCategory category;
    return category;
}

inline std::error_code make_error_code(UplinkErrc e) noexcept {
    return {static_cast<int>(e), uplink_errc_category()};
}

} // namespace uplink::core

namespace std {

template<>
struct is_error_code_enum<uplink::core::UplinkErrc> : true_type {};

} // namespace std
