// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplink/core/error.hpp>

using namespace uplink::core;

TEST_CASE("UplinkErrc error category", "[error]") {
    SECTION("Category name") {
        auto ec = make_error_code(UplinkErrc::no_available_endpoint);
        CHECK(std::string(ec.category().name()) == "uplink::core");
    }

    SECTION("Messages") {
        CHECK(make_error_code(UplinkErrc::no_available_endpoint).message() == "No available endpoint");
        CHECK(make_error_code(UplinkErrc::probe_timeout).message() == "Endpoint probe timed out");
        CHECK(make_error_code(UplinkErrc::invalid_config).message() == "Invalid configuration");
    }

    SECTION("Implicit conversion to error_code") {
        std::error_code ec = UplinkErrc::invalid_url;
        CHECK(ec == UplinkErrc::invalid_url);
        CHECK(ec != UplinkErrc::invalid_config);
        CHECK(static_cast<bool>(ec));
    }

    SECTION("Success is not an error") {
        std::error_code ec = UplinkErrc::success;
        CHECK_FALSE(static_cast<bool>(ec));
    }
}
