// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/config.hpp>
#include <uplink/core/network_quality.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uplink::core {

// One completed (or failed) chunk transfer
struct TransferSample {
    Clock::time_point timestamp{};
    std::uint64_t bytes{0};
    double duration_ms{0.0};
    double throughput_bps{0.0};
    bool success{true};
    std::optional<double> latency_ms;
};

enum class ThroughputTrend : std::uint8_t { stable, improving, degrading };
enum class RttTrend : std::uint8_t { stable, increasing, decreasing };

[[nodiscard]] constexpr std::string_view to_string(ThroughputTrend trend) noexcept {
    switch (trend) {
        case ThroughputTrend::improving: return "improving";
        case ThroughputTrend::degrading: return "degrading";
        default: return "stable";
    }
}

[[nodiscard]] constexpr std::string_view to_string(RttTrend trend) noexcept {
    switch (trend) {
        case RttTrend::increasing: return "increasing";
        case RttTrend::decreasing: return "decreasing";
        default: return "stable";
    }
}

// Derived statistics, recomputed on every sampling tick
struct PerformanceStats {
    double current_throughput{0.0};    // bytes/s over the throughput window
    double average_throughput{0.0};    // EMA of current_throughput
    double peak_throughput{0.0};
    double jitter_ms{0.0};
    double packet_loss{0.0};           // [0, 1]
    double rtt_variation_ms{0.0};      // max - min over recent RTT samples
    double average_rtt_ms{0.0};
    bool is_stable{false};
    ThroughputTrend trend{ThroughputTrend::stable};
};

struct TelemetryConfig {
    std::size_t max_transfer_samples{TRANSFER_SAMPLE_WINDOW};
    std::size_t max_rtt_samples{RTT_SAMPLE_WINDOW};
    std::chrono::milliseconds throughput_window{THROUGHPUT_WINDOW};
    std::uint32_t stability_threshold{STABILITY_THRESHOLD};
    double stability_cv_threshold{STABILITY_CV_THRESHOLD};
    double ema_alpha{EMA_ALPHA};
    double jitter_alpha{EMA_ALPHA};
    double loss_correction{PACKET_LOSS_CORRECTION};
    std::size_t trend_samples{3};
    double improving_ratio{1.2};
    double degrading_ratio{0.8};
    std::size_t rtt_variation_samples{3};
    std::size_t success_rate_samples{10};

    double extreme_packet_loss{EXTREME_PACKET_LOSS};
    double extreme_rtt_variation_ms{EXTREME_RTT_VARIATION_MS};
    double extreme_average_rtt_ms{EXTREME_AVERAGE_RTT_MS};
    double extreme_min_throughput_bps{EXTREME_MIN_THROUGHPUT_BPS};
    double extreme_jitter_ms{EXTREME_JITTER_MS};

    // Copy with every field forced into its valid range
    [[nodiscard]] TelemetryConfig sanitized() const noexcept;
};

// Windowed network performance estimator fed by transfer completions.
// Every public member is safe to call from concurrent completion callbacks.
class TelemetryAnalyzer {
public:
    explicit TelemetryAnalyzer(TelemetryConfig config = {}, Clock::time_point start = Clock::now());

    TelemetryAnalyzer(const TelemetryAnalyzer&) = delete;
    TelemetryAnalyzer& operator=(const TelemetryAnalyzer&) = delete;

    // Without a duration, the elapsed time since the previous sample is used
    void record_transfer(std::uint64_t bytes, bool success,
                         std::optional<double> duration_ms = std::nullopt,
                         Clock::time_point now = Clock::now());

    void update_rtt_sample(double rtt_ms);

    // Round-trip bookkeeping for a single chunk
    void chunk_started(const std::string& chunk_id, std::uint64_t bytes,
                       Clock::time_point now = Clock::now());
    // Returns the measured round trip, or nullopt for an unknown chunk
    std::optional<double> chunk_finished(const std::string& chunk_id, bool success,
                                         Clock::time_point now = Clock::now());

    void recompute_stats(Clock::time_point now = Clock::now());

    [[nodiscard]] PerformanceStats stats() const;
    [[nodiscard]] bool extreme_conditions() const;
    [[nodiscard]] double average_rtt() const;
    [[nodiscard]] RttTrend rtt_trend() const;
    [[nodiscard]] double recent_success_rate() const;

    [[nodiscard]] std::size_t transfer_sample_count() const;
    [[nodiscard]] std::size_t rtt_sample_count() const;
    [[nodiscard]] std::size_t inflight_chunk_count() const;
    [[nodiscard]] std::vector<TransferSample> transfer_samples() const;
    [[nodiscard]] const TelemetryConfig& config() const noexcept { return config_; }

    void reset(Clock::time_point now = Clock::now());

private:
    struct InflightChunk {
        Clock::time_point started;
        std::uint64_t bytes;
    };

    void record_transfer_locked(std::uint64_t bytes, bool success,
                                std::optional<double> duration_ms,
                                std::optional<double> latency_ms,
                                Clock::time_point now);
    void update_rtt_locked(double rtt_ms);
    void update_current_throughput(Clock::time_point now);
    void update_stability();
    void update_packet_loss();
    void update_trend();
    [[nodiscard]] double average_rtt_locked() const noexcept;
    [[nodiscard]] double success_rate_locked() const noexcept;
    [[nodiscard]] bool extreme_locked() const noexcept;

    TelemetryConfig config_;
    mutable std::mutex mutex_;

    std::deque<TransferSample> transfers_;
    std::deque<double> rtts_;
    std::map<std::string, InflightChunk> inflight_;

    PerformanceStats stats_;
    Clock::time_point last_sample_time_;
    std::uint32_t consecutive_stable_{0};
    bool has_current_{false};
};

} // namespace uplink::core
