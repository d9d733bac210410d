// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace uplink::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(UplinkErrc::invalid_url));
    }

    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(UplinkErrc::invalid_url));
    }

    auto rest_start = scheme_end + 3;
    auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
    auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
    auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());
    auto host_end = std::min({path_start, query_start, fragment_start});

    // Drop userinfo
    std::size_t authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(UplinkErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        url.host_ = std::string(authority.substr(0, colon));
        url.port_ = std::string(authority.substr(colon + 1));
    } else {
        url.host_ = std::string(authority);
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(UplinkErrc::invalid_url));
    }

    if (!url.port_.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(url.port_.data(), url.port_.data() + url.port_.size(), value);
        if (ec != std::errc{} || ptr != url.port_.data() + url.port_.size() || value == 0 || value > 65535) {
            return std::unexpected(make_error_code(UplinkErrc::invalid_url));
        }
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    return url;
}

std::string Url::full() const {
    std::string result = origin();
    result += path_;
    if (!query_.empty()) {
        result += '?';
        result += query_;
    }
    return result;
}

std::string Url::origin() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ':';
        result += port_;
    }
    return result;
}

std::uint16_t Url::effective_port() const noexcept {
    if (!port_.empty()) {
        unsigned value = 0;
        std::from_chars(port_.data(), port_.data() + port_.size(), value);
        return static_cast<std::uint16_t>(value);
    }
    return is_secure() ? 443 : 80;
}

} // namespace uplink::core
