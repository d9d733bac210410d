// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplink/core/parameter_adjuster.hpp>

using namespace uplink::core;

namespace {

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * 1024;

QualityAssessment quality(NetworkQualityTier tier, bool unstable = false) {
    QualityAssessment q;
    q.tier = tier;
    q.is_unstable = unstable;
    return q;
}

} // namespace

TEST_CASE("Built-in presets", "[params]") {
    ParameterAdjuster adjuster;

    SECTION("Low tier") {
        auto p = adjuster.preset(NetworkQualityTier::low);
        CHECK(p.chunk_size == 384 * KiB);
        CHECK(p.concurrency == 2);
        CHECK(p.retry_count == 4);
        CHECK(p.retry_delay_ms == 1200);
        CHECK(p.timeout_ms == 40000);
    }

    SECTION("Constrained tiers avoid background workers") {
        CHECK_FALSE(adjuster.preset(NetworkQualityTier::very_poor).use_worker);
        CHECK_FALSE(adjuster.preset(NetworkQualityTier::offline).use_worker);
        CHECK(adjuster.preset(NetworkQualityTier::good).use_worker);
    }

    SECTION("Offline is the minimum safe set") {
        CHECK(adjuster.preset(NetworkQualityTier::offline) == adjuster.minimum_safe_parameters());
    }

    SECTION("Chunk size grows with quality") {
        for (std::size_t i = 1; i < TIER_COUNT; ++i) {
            auto worse = adjuster.preset(static_cast<NetworkQualityTier>(i - 1));
            auto better = adjuster.preset(static_cast<NetworkQualityTier>(i));
            CHECK(better.chunk_size >= worse.chunk_size);
            CHECK(better.concurrency >= worse.concurrency);
        }
    }
}

TEST_CASE("ParameterAdjuster::validate_parameters", "[params]") {
    ParameterAdjuster adjuster;

    UploadParameters p;
    p.chunk_size = 1;
    p.concurrency = 100;
    p.retry_delay_ms = 50;
    p.timeout_ms = 10;

    auto v = adjuster.validate_parameters(p);
    CHECK(v.chunk_size == MIN_CHUNK_SIZE);
    CHECK(v.concurrency == 6);
    CHECK(v.retry_delay_ms == MIN_RETRY_DELAY_MS);
    CHECK(v.timeout_ms == MIN_TIMEOUT_MS);

    p.chunk_size = 64 * MiB;
    p.concurrency = 0;
    v = adjuster.validate_parameters(p);
    CHECK(v.chunk_size == MAX_CHUNK_SIZE);
    CHECK(v.concurrency == 1);
}

TEST_CASE("ParameterAdjuster::minimum_safe_parameters", "[params]") {
    ParameterAdjuster adjuster;
    auto p = adjuster.minimum_safe_parameters();
    CHECK(p.chunk_size == MIN_CHUNK_SIZE);
    CHECK(p.concurrency == 1);
    CHECK(p.retry_count == 5);
    CHECK(p.timeout_ms == 60000);
    CHECK(p.precheck_enabled);
    CHECK_FALSE(p.use_worker);
}

TEST_CASE("ParameterAdjuster on unstable links", "[params]") {
    ParameterAdjuster adjuster;
    UploadParameters current;  // 512 KiB, 3 in flight

    auto p = adjuster.adjust_parameters(quality(NetworkQualityTier::moderate, true), current);
    CHECK(p.chunk_size == 384 * KiB);
    CHECK(p.concurrency == 2);
    CHECK(p.retry_count == 4);
    CHECK(p.retry_delay_ms == 1500);
    CHECK(p.timeout_ms == 45000);
    CHECK(p.precheck_enabled);

    SECTION("Never more aggressive than the current set") {
        UploadParameters timid{MIN_CHUNK_SIZE, 1, 8, 5000, 90000, false, false};
        auto t = adjuster.adjust_parameters(quality(NetworkQualityTier::excellent, true), timid);
        CHECK(t.chunk_size == MIN_CHUNK_SIZE);
        CHECK(t.concurrency == 1);
        CHECK(t.retry_count == 8);
        CHECK(t.retry_delay_ms == 5000);
        CHECK(t.timeout_ms == 90000);
        CHECK(t.precheck_enabled);
    }
}

TEST_CASE("ParameterAdjuster smooths changes", "[params]") {
    SECTION("Chunk doubles at most, concurrency moves by two") {
        ParameterAdjuster adjuster;
        UploadParameters current;
        current.chunk_size = 128 * KiB;
        current.concurrency = 1;

        auto p = adjuster.adjust_parameters(quality(NetworkQualityTier::good), current);
        CHECK(p.chunk_size == 256 * KiB);
        CHECK(p.concurrency == 3);
        CHECK(p.retry_count == 2);
    }

    SECTION("Chunk halves at most") {
        ParameterAdjuster adjuster;
        UploadParameters current;
        current.chunk_size = 4 * MiB;
        current.concurrency = 6;

        auto p = adjuster.adjust_parameters(quality(NetworkQualityTier::very_poor), current);
        CHECK(p.chunk_size == 2 * MiB);
        CHECK(p.concurrency == 4);
    }

    SECTION("Large preset jump") {
        AdjusterConfig config;
        config.max_chunk_size = 16 * MiB;
        auto big = default_preset(NetworkQualityTier::excellent);
        big.chunk_size = 10 * MiB;
        config.preset_overrides[static_cast<std::size_t>(NetworkQualityTier::excellent)] = big;
        ParameterAdjuster adjuster(config);

        UploadParameters current;
        current.chunk_size = 1 * MiB;
        auto p = adjuster.adjust_parameters(quality(NetworkQualityTier::excellent), current);
        CHECK(p.chunk_size <= 2 * MiB);
        CHECK(adjuster.recommended_parameters(quality(NetworkQualityTier::excellent)).chunk_size == 10 * MiB);
    }

    SECTION("Results always validate") {
        ParameterAdjuster adjuster;
        UploadParameters wild{1, 0, 0, 0, 0, false, true};
        for (std::size_t i = 0; i < TIER_COUNT; ++i) {
            auto tier = static_cast<NetworkQualityTier>(i);
            for (bool unstable : {false, true}) {
                auto p = adjuster.adjust_parameters(quality(tier, unstable), wild);
                CHECK(p == adjuster.validate_parameters(p));
            }
        }
    }
}

TEST_CASE("ParameterAdjuster learns from history", "[params]") {
    ParameterAdjuster adjuster;
    auto q = quality(NetworkQualityTier::moderate);

    UploadParameters winner;
    winner.chunk_size = 1 * MiB;
    winner.concurrency = 5;

    auto record_baseline = [&](int n) {
        for (int i = 0; i < n; ++i) {
            adjuster.record_upload_result(q, adjuster.preset(NetworkQualityTier::moderate), true, 100000.0);
        }
    };

    SECTION("Clear winner is adopted") {
        record_baseline(4);
        adjuster.record_upload_result(q, winner, true, 1000000.0);

        auto p = adjuster.recommended_parameters(q);
        CHECK(p.chunk_size == 1 * MiB);
        CHECK(p.concurrency == 5);
        CHECK(p.retry_count == 3);
    }

    SECTION("Too few samples") {
        record_baseline(3);
        adjuster.record_upload_result(q, winner, true, 1000000.0);
        CHECK(adjuster.recommended_parameters(q).chunk_size == 512 * KiB);
    }

    SECTION("Failures and rate-less outcomes do not count") {
        record_baseline(2);
        adjuster.record_upload_result(q, winner, true, 1000000.0);
        adjuster.record_upload_result(q, winner, false, 1000000.0);
        adjuster.record_upload_result(q, winner, true);
        CHECK(adjuster.recommended_parameters(q).chunk_size == 512 * KiB);
    }

    SECTION("Other tiers are ignored") {
        record_baseline(4);
        adjuster.record_upload_result(q, winner, true, 1000000.0);
        CHECK(adjuster.recommended_parameters(quality(NetworkQualityTier::good)).chunk_size == 1 * MiB);
        CHECK(adjuster.recommended_parameters(quality(NetworkQualityTier::good)).concurrency == 4);
    }

    SECTION("No clear winner") {
        record_baseline(6);
        CHECK(adjuster.recommended_parameters(q) == adjuster.preset(NetworkQualityTier::moderate));
    }

    SECTION("Learning disabled") {
        AdjusterConfig config;
        config.adaptive_learning = false;
        ParameterAdjuster plain(config);
        for (int i = 0; i < 4; ++i) {
            plain.record_upload_result(q, plain.preset(NetworkQualityTier::moderate), true, 100000.0);
        }
        plain.record_upload_result(q, winner, true, 1000000.0);
        CHECK(plain.recommended_parameters(q).chunk_size == 512 * KiB);
    }
}

TEST_CASE("ParameterAdjuster history", "[params]") {
    ParameterAdjuster adjuster;
    auto q = quality(NetworkQualityTier::good);

    for (int i = 0; i < 30; ++i) {
        adjuster.record_upload_result(q, {}, i % 2 == 0, 1000.0 * i);
    }
    auto history = adjuster.history();
    REQUIRE(history.size() == HISTORY_SIZE);
    CHECK(history.front().transfer_rate == 10000.0);

    adjuster.reset_history();
    CHECK(adjuster.history().empty());
}

TEST_CASE("AdjusterConfig::sanitized", "[params]") {
    AdjusterConfig config;
    config.min_chunk_size = 1 * MiB;
    config.max_chunk_size = 256 * KiB;
    config.min_concurrency = 0;
    config.max_concurrency = 0;
    config.learning_gain = 0.5;

    auto c = config.sanitized();
    CHECK(c.max_chunk_size == 1 * MiB);
    CHECK(c.min_concurrency == 1);
    CHECK(c.max_concurrency == 1);
    CHECK(c.learning_gain == 1.2);
}
