// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplink/core/telemetry_analyzer.hpp>
#include <thread>
#include <vector>

using namespace uplink::core;
using namespace std::chrono_literals;

namespace {

const Clock::time_point t0{};

// bytes for `kbps` KiB/s over one second
std::uint64_t kib_per_second(std::uint64_t kbps) {
    return kbps * 1024;
}

} // namespace

TEST_CASE("TelemetryAnalyzer windows are bounded", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    for (int i = 0; i < 40; ++i) {
        telemetry.record_transfer(1024, true, 100.0, t0 + std::chrono::milliseconds(i * 100));
        telemetry.update_rtt_sample(50.0 + i);
    }

    CHECK(telemetry.transfer_sample_count() == TRANSFER_SAMPLE_WINDOW);
    CHECK(telemetry.rtt_sample_count() == RTT_SAMPLE_WINDOW);

    // Oldest samples are evicted first
    auto samples = telemetry.transfer_samples();
    CHECK(samples.front().timestamp == t0 + 2500ms);
}

TEST_CASE("TelemetryAnalyzer jitter EMA", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    SECTION("First sample seeds zero") {
        telemetry.update_rtt_sample(100.0);
        CHECK(telemetry.stats().jitter_ms == 0.0);
    }

    SECTION("Smoothed absolute deltas") {
        telemetry.update_rtt_sample(100.0);
        telemetry.update_rtt_sample(120.0);
        CHECK(telemetry.stats().jitter_ms == Catch::Approx(6.0));
        telemetry.update_rtt_sample(110.0);
        CHECK(telemetry.stats().jitter_ms == Catch::Approx(7.2));
    }

    SECTION("Invalid samples are ignored") {
        telemetry.update_rtt_sample(-5.0);
        CHECK(telemetry.rtt_sample_count() == 0);
    }
}

TEST_CASE("TelemetryAnalyzer current throughput", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    SECTION("Windowed sum of bytes over sum of durations") {
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 1s);
        telemetry.record_transfer(kib_per_second(300), true, 1000.0, t0 + 2s);
        telemetry.recompute_stats(t0 + 2s);

        auto stats = telemetry.stats();
        CHECK(stats.current_throughput == Catch::Approx(200.0 * 1024));
        CHECK(stats.average_throughput == Catch::Approx(200.0 * 1024));
        CHECK(stats.peak_throughput == Catch::Approx(200.0 * 1024));
    }

    SECTION("Fewer than two samples holds the previous value") {
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 1s);
        telemetry.recompute_stats(t0 + 1s);
        CHECK(telemetry.stats().current_throughput == 0.0);

        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 2s);
        telemetry.recompute_stats(t0 + 2s);
        CHECK(telemetry.stats().current_throughput == Catch::Approx(100.0 * 1024));

        // Both samples age out: hold
        telemetry.recompute_stats(t0 + 60s);
        CHECK(telemetry.stats().current_throughput == Catch::Approx(100.0 * 1024));
    }

    SECTION("Samples exactly one window old are excluded") {
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 5s);
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 10s);
        telemetry.recompute_stats(t0 + 10s);
        CHECK(telemetry.stats().current_throughput == 0.0);
    }

    SECTION("Average is an EMA seeded by the first value, peak a running max") {
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 1s);
        telemetry.record_transfer(kib_per_second(100), true, 1000.0, t0 + 2s);
        telemetry.recompute_stats(t0 + 2s);

        telemetry.record_transfer(kib_per_second(400), true, 1000.0, t0 + 9s);
        telemetry.record_transfer(kib_per_second(400), true, 1000.0, t0 + 10s);
        telemetry.recompute_stats(t0 + 10s);

        auto stats = telemetry.stats();
        CHECK(stats.current_throughput == Catch::Approx(400.0 * 1024));
        CHECK(stats.average_throughput == Catch::Approx((0.7 * 100 + 0.3 * 400) * 1024));
        CHECK(stats.peak_throughput == Catch::Approx(400.0 * 1024));

        telemetry.record_transfer(kib_per_second(50), true, 1000.0, t0 + 17s);
        telemetry.record_transfer(kib_per_second(50), true, 1000.0, t0 + 18s);
        telemetry.recompute_stats(t0 + 18s);
        CHECK(telemetry.stats().peak_throughput == Catch::Approx(400.0 * 1024));
    }

    SECTION("Missing duration uses time since the previous sample") {
        telemetry.record_transfer(2000, true, std::nullopt, t0 + 2s);
        auto samples = telemetry.transfer_samples();
        REQUIRE(samples.size() == 1);
        CHECK(samples[0].duration_ms == Catch::Approx(2000.0));
        CHECK(samples[0].throughput_bps == Catch::Approx(1000.0));
    }
}

TEST_CASE("TelemetryAnalyzer stability hysteresis", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    auto feed = [&](std::uint64_t kbps, int second) {
        telemetry.record_transfer(kib_per_second(kbps), true, 1000.0, t0 + std::chrono::seconds(second));
        telemetry.recompute_stats(t0 + std::chrono::seconds(second));
    };

    feed(100, 1);
    CHECK_FALSE(telemetry.stats().is_stable);
    feed(105, 2);
    CHECK_FALSE(telemetry.stats().is_stable);
    feed(98, 3);
    CHECK(telemetry.stats().is_stable);

    // One high-variance reading flips it back at once
    feed(1000, 4);
    CHECK_FALSE(telemetry.stats().is_stable);

    // And it takes a full run of stable readings to recover
    feed(1000, 5);
    CHECK_FALSE(telemetry.stats().is_stable);
    feed(1000, 6);
    feed(1000, 7);
    CHECK_FALSE(telemetry.stats().is_stable);
    feed(1000, 8);
    CHECK(telemetry.stats().is_stable);
}

TEST_CASE("TelemetryAnalyzer dead link is never stable", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    for (int i = 1; i <= 5; ++i) {
        telemetry.record_transfer(0, false, 1000.0, t0 + std::chrono::seconds(i));
        telemetry.recompute_stats(t0 + std::chrono::seconds(i));
        CHECK_FALSE(telemetry.stats().is_stable);
    }
}

TEST_CASE("TelemetryAnalyzer throughput trend", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    auto feed = [&](std::uint64_t kbps, int second) {
        telemetry.record_transfer(kib_per_second(kbps), true, 1000.0, t0 + std::chrono::seconds(second));
    };

    SECTION("Not enough samples holds stable") {
        feed(100, 1);
        feed(300, 2);
        telemetry.recompute_stats(t0 + 2s);
        CHECK(telemetry.stats().trend == ThroughputTrend::stable);
    }

    SECTION("Improving") {
        feed(100, 1);
        feed(100, 2);
        feed(200, 3);
        telemetry.recompute_stats(t0 + 3s);
        CHECK(telemetry.stats().trend == ThroughputTrend::improving);
    }

    SECTION("Degrading") {
        feed(100, 1);
        feed(100, 2);
        feed(50, 3);
        telemetry.recompute_stats(t0 + 3s);
        CHECK(telemetry.stats().trend == ThroughputTrend::degrading);
    }

    SECTION("Small moves stay stable") {
        feed(100, 1);
        feed(100, 2);
        feed(110, 3);
        telemetry.recompute_stats(t0 + 3s);
        CHECK(telemetry.stats().trend == ThroughputTrend::stable);
    }
}

TEST_CASE("TelemetryAnalyzer packet loss estimate", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    SECTION("No transfers means no loss") {
        telemetry.recompute_stats(t0 + 1s);
        CHECK(telemetry.stats().packet_loss == 0.0);
    }

    SECTION("Counted from the first failures") {
        for (int i = 0; i < 4; ++i) {
            telemetry.record_transfer(1024, false, 100.0, t0 + std::chrono::seconds(i));
        }
        telemetry.recompute_stats(t0 + 4s);
        CHECK(telemetry.recent_success_rate() == 0.0);
        CHECK(telemetry.stats().packet_loss == Catch::Approx(0.7));
        CHECK(telemetry.extreme_conditions());
    }

    SECTION("Failure rate scaled by the retry correction") {
        for (int i = 0; i < 5; ++i) {
            telemetry.record_transfer(1024, i < 3, 100.0, t0 + std::chrono::seconds(i));
        }
        telemetry.recompute_stats(t0 + 5s);
        CHECK(telemetry.stats().packet_loss == Catch::Approx(0.4 * 0.7));
        CHECK(telemetry.recent_success_rate() == Catch::Approx(0.6));
    }

    SECTION("Always within [0, 1]") {
        for (int i = 0; i < 15; ++i) {
            telemetry.record_transfer(1024, false, 100.0, t0 + std::chrono::seconds(i));
        }
        telemetry.recompute_stats(t0 + 15s);
        auto loss = telemetry.stats().packet_loss;
        CHECK(loss >= 0.0);
        CHECK(loss <= 1.0);
        CHECK(loss == Catch::Approx(0.7));
    }
}

TEST_CASE("TelemetryAnalyzer extreme conditions", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    SECTION("No throughput measured yet counts as extreme") {
        telemetry.recompute_stats(t0);
        CHECK(telemetry.extreme_conditions());
    }

    // Healthy baseline: 1 MiB/s, 50 ms RTT
    for (int i = 1; i <= 3; ++i) {
        telemetry.record_transfer(1024 * 1024, true, 1000.0, t0 + std::chrono::seconds(i));
        telemetry.update_rtt_sample(50.0);
    }
    telemetry.recompute_stats(t0 + 3s);
    REQUIRE_FALSE(telemetry.extreme_conditions());

    SECTION("High average RTT") {
        for (int i = 0; i < 10; ++i) telemetry.update_rtt_sample(1200.0);
        telemetry.recompute_stats(t0 + 3s);
        CHECK(telemetry.extreme_conditions());
    }

    SECTION("Large RTT variation") {
        telemetry.update_rtt_sample(400.0);
        telemetry.recompute_stats(t0 + 3s);
        CHECK(telemetry.stats().rtt_variation_ms == Catch::Approx(350.0));
        CHECK(telemetry.extreme_conditions());
    }

    SECTION("Low throughput") {
        telemetry.record_transfer(10 * 1024, true, 1000.0, t0 + 10s);
        telemetry.record_transfer(10 * 1024, true, 1000.0, t0 + 11s);
        telemetry.recompute_stats(t0 + 11s);
        CHECK(telemetry.extreme_conditions());
    }

    SECTION("Heavy loss") {
        for (int i = 0; i < 10; ++i) {
            telemetry.record_transfer(1024 * 1024, i % 2 == 0, 1000.0, t0 + std::chrono::milliseconds(3100 + i * 100));
        }
        telemetry.recompute_stats(t0 + 4100ms);
        CHECK(telemetry.stats().packet_loss > 0.15);
        CHECK(telemetry.extreme_conditions());
    }
}

TEST_CASE("TelemetryAnalyzer extreme jitter", "[telemetry]") {
    // Variation alone must not trip the check here
    TelemetryConfig config;
    config.extreme_rtt_variation_ms = 1000.0;
    TelemetryAnalyzer telemetry(config, t0);

    for (int i = 1; i <= 3; ++i) {
        telemetry.record_transfer(1024 * 1024, true, 1000.0, t0 + std::chrono::seconds(i));
        telemetry.update_rtt_sample(50.0);
    }
    telemetry.recompute_stats(t0 + 3s);
    REQUIRE_FALSE(telemetry.extreme_conditions());

    for (int i = 0; i < 4; ++i) {
        telemetry.update_rtt_sample(400.0);
        telemetry.update_rtt_sample(50.0);
    }
    telemetry.recompute_stats(t0 + 3s);

    auto stats = telemetry.stats();
    CHECK(stats.jitter_ms > 100.0);
    CHECK(stats.average_rtt_ms < 1000.0);
    CHECK(stats.packet_loss == 0.0);
    CHECK(telemetry.extreme_conditions());
}

TEST_CASE("TelemetryAnalyzer per-chunk round trips", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    telemetry.chunk_started("c1", 4096, t0);
    CHECK(telemetry.inflight_chunk_count() == 1);

    auto rtt = telemetry.chunk_finished("c1", true, t0 + 250ms);
    REQUIRE(rtt.has_value());
    CHECK(*rtt == Catch::Approx(250.0));
    CHECK(telemetry.inflight_chunk_count() == 0);
    CHECK(telemetry.rtt_sample_count() == 1);
    CHECK(telemetry.transfer_sample_count() == 1);

    CHECK_FALSE(telemetry.chunk_finished("unknown", true, t0 + 300ms).has_value());

    SECTION("In-flight table is bounded") {
        for (std::size_t i = 0; i < MAX_INFLIGHT_CHUNKS + 20; ++i) {
            telemetry.chunk_started("chunk-" + std::to_string(i), 1024, t0 + std::chrono::milliseconds(i));
        }
        CHECK(telemetry.inflight_chunk_count() == MAX_INFLIGHT_CHUNKS);
        // The oldest were dropped
        CHECK_FALSE(telemetry.chunk_finished("chunk-0", true, t0 + 1s).has_value());
    }
}

TEST_CASE("TelemetryAnalyzer RTT trend", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);

    telemetry.update_rtt_sample(100.0);
    telemetry.update_rtt_sample(150.0);
    CHECK(telemetry.rtt_trend() == RttTrend::stable);

    telemetry.update_rtt_sample(200.0);
    CHECK(telemetry.rtt_trend() == RttTrend::increasing);

    for (int i = 0; i < 10; ++i) telemetry.update_rtt_sample(200.0 - i * 15.0);
    CHECK(telemetry.rtt_trend() == RttTrend::decreasing);
}

TEST_CASE("TelemetryAnalyzer concurrent writers", "[telemetry]") {
    TelemetryAnalyzer telemetry;

    std::vector<std::thread> writers;
    for (int w = 0; w < 8; ++w) {
        writers.emplace_back([&telemetry, w] {
            for (int i = 0; i < 500; ++i) {
                telemetry.record_transfer(1024, (i + w) % 7 != 0, 10.0);
                telemetry.update_rtt_sample(40.0 + (i % 20));
                if (i % 50 == 0) telemetry.recompute_stats();
            }
        });
    }
    for (auto& t : writers) t.join();

    CHECK(telemetry.transfer_sample_count() == TRANSFER_SAMPLE_WINDOW);
    CHECK(telemetry.rtt_sample_count() == RTT_SAMPLE_WINDOW);
    auto stats = telemetry.stats();
    CHECK(stats.packet_loss >= 0.0);
    CHECK(stats.packet_loss <= 1.0);
}

TEST_CASE("TelemetryAnalyzer reset", "[telemetry]") {
    TelemetryAnalyzer telemetry({}, t0);
    telemetry.record_transfer(1024, true, 10.0, t0 + 1s);
    telemetry.record_transfer(1024, true, 10.0, t0 + 2s);
    telemetry.update_rtt_sample(80.0);
    telemetry.recompute_stats(t0 + 2s);

    telemetry.reset(t0 + 3s);
    CHECK(telemetry.transfer_sample_count() == 0);
    CHECK(telemetry.rtt_sample_count() == 0);
    CHECK(telemetry.stats().current_throughput == 0.0);
    CHECK(telemetry.average_rtt() == 0.0);
}

TEST_CASE("TelemetryConfig::sanitized", "[telemetry]") {
    TelemetryConfig config;
    config.max_transfer_samples = 0;
    config.stability_threshold = 0;
    config.ema_alpha = 3.0;
    config.loss_correction = -1.0;

    auto c = config.sanitized();
    CHECK(c.max_transfer_samples == 1);
    CHECK(c.stability_threshold == 1);
    CHECK(c.ema_alpha == 1.0);
    CHECK(c.loss_correction == 0.0);
}
