// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplink/core/session_config.hpp>
#include <filesystem>
#include <fstream>

using namespace uplink::core;

TEST_CASE("SessionConfig::parse - defaults", "[config]") {
    auto result = SessionConfig::parse("{}");
    REQUIRE(result.has_value());
    CHECK(result->telemetry.max_transfer_samples == TRANSFER_SAMPLE_WINDOW);
    CHECK(result->concurrency.base_concurrency == BASE_CONCURRENCY);
    CHECK(result->adjuster.max_chunk_size == MAX_CHUNK_SIZE);
    CHECK(result->selector.profile == SelectorProfile::path);
    CHECK(result->endpoints.empty());
}

TEST_CASE("SessionConfig::parse - full document", "[config]") {
    auto result = SessionConfig::parse(R"({
        "telemetry": {
            "max_transfer_samples": 30,
            "throughput_window_ms": 8000,
            "ema_alpha": 0.5,
            "extreme": { "packet_loss": 0.25, "average_rtt_ms": 1500 }
        },
        "concurrency": {
            "min": 2, "max": 10, "base": 4,
            "adaptation_interval_ms": 2000,
            "exploration": false,
            "seed": 7
        },
        "parameters": {
            "max_concurrency": 10,
            "adaptive_learning": false,
            "presets": {
                "good": { "chunk_size": 3145728, "concurrency": 5 }
            }
        },
        "selector": {
            "profile": "cdn",
            "local_region": "AP-South",
            "max_candidates": 4
        },
        "endpoints": [
            { "url": "https://a.example.com/up", "id": "a", "region": "ap-south", "weight": 0.7 },
            { "url": "https://b.example.com/up", "enabled": false }
        ]
    })");

    REQUIRE(result.has_value());
    const auto& c = *result;

    CHECK(c.telemetry.max_transfer_samples == 30);
    CHECK(c.telemetry.throughput_window == std::chrono::milliseconds(8000));
    CHECK(c.telemetry.ema_alpha == 0.5);
    CHECK(c.telemetry.extreme_packet_loss == 0.25);
    CHECK(c.telemetry.extreme_average_rtt_ms == 1500.0);
    CHECK(c.telemetry.extreme_jitter_ms == EXTREME_JITTER_MS);

    CHECK(c.concurrency.min_concurrency == 2);
    CHECK(c.concurrency.max_concurrency == 10);
    CHECK(c.concurrency.base_concurrency == 4);
    CHECK(c.concurrency.adaptation_interval == std::chrono::milliseconds(2000));
    CHECK_FALSE(c.concurrency.exploration_enabled);
    CHECK(c.concurrency.seed == 7);

    CHECK(c.adjuster.max_concurrency == 10);
    CHECK_FALSE(c.adjuster.adaptive_learning);
    const auto& good = c.adjuster.preset_overrides[static_cast<std::size_t>(NetworkQualityTier::good)];
    REQUIRE(good.has_value());
    CHECK(good->chunk_size == 3145728);
    CHECK(good->concurrency == 5);
    // Unspecified preset fields come from the built-in table
    CHECK(good->retry_count == default_preset(NetworkQualityTier::good).retry_count);

    CHECK(c.selector.profile == SelectorProfile::cdn);
    CHECK(c.selector.local_region == "ap-south");
    CHECK(c.selector.max_candidates == 4);

    REQUIRE(c.endpoints.size() == 2);
    CHECK(c.endpoints[0].id == "a");
    CHECK(c.endpoints[0].weight == 0.7);
    CHECK(c.endpoints[1].id == "https://b.example.com/up");
    CHECK_FALSE(c.endpoints[1].enabled);
}

TEST_CASE("SessionConfig::parse - clamps out-of-range values", "[config]") {
    auto result = SessionConfig::parse(R"({
        "telemetry": { "max_transfer_samples": -4, "ema_alpha": 7 },
        "concurrency": { "min": 0, "max": 1000, "base": 999 }
    })");
    REQUIRE(result.has_value());
    CHECK(result->telemetry.max_transfer_samples == 1);
    CHECK(result->telemetry.ema_alpha == 1.0);
    CHECK(result->concurrency.min_concurrency == 1);
    CHECK(result->concurrency.max_concurrency == CONCURRENCY_CEILING);
    CHECK(result->concurrency.base_concurrency == CONCURRENCY_CEILING);
}

TEST_CASE("SessionConfig::parse - rejects invalid documents", "[config]") {
    auto rejects = [](std::string_view text) {
        auto result = SessionConfig::parse(text);
        return !result.has_value() && result.error() == UplinkErrc::invalid_config;
    };

    CHECK(rejects("not json"));
    CHECK(rejects("[1, 2, 3]"));
    CHECK(rejects(R"({"concurrency": {"min": "two"}})"));
    CHECK(rejects(R"({"parameters": {"presets": {"superb": {}}}})"));
    CHECK(rejects(R"({"selector": {"profile": "satellite"}})"));
    CHECK(rejects(R"({"endpoints": {"url": "https://a.example.com"}})"));
    CHECK(rejects(R"({"endpoints": [{"id": "no-url"}]})"));
}

TEST_CASE("SessionConfig::load", "[config]") {
    SECTION("Missing file") {
        auto result = SessionConfig::load("/nonexistent/uplink/session.json");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == UplinkErrc::config_not_found);
    }

    SECTION("File on disk") {
        auto path = std::filesystem::temp_directory_path() / "uplink_session_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"selector": {"local_region": "eu"}, "endpoints": [{"url": "https://eu.example.com/u"}]})";
        }

        auto result = SessionConfig::load(path);
        std::filesystem::remove(path);

        REQUIRE(result.has_value());
        CHECK(result->selector.local_region == "eu");
        REQUIRE(result->endpoints.size() == 1);
    }
}
