// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/quality_evaluator.hpp>
#include <algorithm>

namespace uplink::core {

namespace {

// Up to 40 points
double throughput_points(double bps) noexcept {
    double kbps = bps / 1024.0;
    if (kbps >= 10000.0) return 40.0;
    if (kbps >= 5000.0) return 34.0;
    if (kbps >= 1000.0) return 27.0;
    if (kbps >= 500.0) return 20.0;
    if (kbps >= 100.0) return 13.0;
    if (kbps >= 50.0) return 7.0;
    return 0.0;
}

// Up to 30 points; an unmeasured RTT gets half credit
double latency_points(double rtt_ms) noexcept {
    if (rtt_ms <= 0.0) return 15.0;
    if (rtt_ms < 50.0) return 30.0;
    if (rtt_ms < 100.0) return 25.0;
    if (rtt_ms < 200.0) return 20.0;
    if (rtt_ms < 300.0) return 15.0;
    if (rtt_ms < 500.0) return 10.0;
    if (rtt_ms < 1000.0) return 5.0;
    return 0.0;
}

// Up to 20 points
double jitter_points(double jitter_ms) noexcept {
    if (jitter_ms < 10.0) return 20.0;
    if (jitter_ms < 20.0) return 15.0;
    if (jitter_ms < 50.0) return 10.0;
    if (jitter_ms < 100.0) return 5.0;
    return 0.0;
}

// Up to 30 points deducted
double loss_penalty(double loss) noexcept {
    if (loss < 0.01) return 0.0;
    if (loss < 0.05) return 5.0;
    if (loss < 0.1) return 10.0;
    if (loss < 0.2) return 20.0;
    return 30.0;
}

} // namespace

double QualityEvaluator::score(const PerformanceStats& stats) noexcept {
    double total = throughput_points(stats.current_throughput)
                 + latency_points(stats.average_rtt_ms)
                 + jitter_points(stats.jitter_ms)
                 + (stats.is_stable ? 10.0 : 0.0)
                 - loss_penalty(stats.packet_loss);
    return std::clamp(total, 0.0, 100.0);
}

NetworkQualityTier QualityEvaluator::tier_for_score(double score) noexcept {
    if (score >= 90.0) return NetworkQualityTier::excellent;
    if (score >= 70.0) return NetworkQualityTier::good;
    if (score >= 50.0) return NetworkQualityTier::moderate;
    if (score >= 35.0) return NetworkQualityTier::low;
    if (score >= 20.0) return NetworkQualityTier::poor;
    return NetworkQualityTier::very_poor;
}

QualityAssessment QualityEvaluator::evaluate(const PerformanceStats& stats,
                                             bool extreme_conditions,
                                             bool online,
                                             Clock::time_point now) const noexcept {
    QualityAssessment result;
    result.throughput_bps = stats.current_throughput;
    result.latency_ms = stats.average_rtt_ms;
    result.packet_loss = stats.packet_loss;
    result.jitter_ms = stats.jitter_ms;
    result.timestamp = now;

    if (!online) {
        result.tier = NetworkQualityTier::offline;
        result.score = 0.0;
        result.is_unstable = true;
        return result;
    }

    result.score = score(stats);
    result.tier = tier_for_score(result.score);
    result.is_unstable = extreme_conditions || (!stats.is_stable && stats.packet_loss > 0.0);
    return result;
}

QualityAssessment QualityEvaluator::evaluate(const TelemetryAnalyzer& telemetry,
                                             bool online,
                                             Clock::time_point now) const {
    return evaluate(telemetry.stats(), telemetry.extreme_conditions(), online, now);
}

} // namespace uplink::core
