// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace uplink::core {

// Parsed upload endpoint address
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string origin() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Explicit port, or the scheme default
    [[nodiscard]] std::uint16_t effective_port() const noexcept;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace uplink::core
