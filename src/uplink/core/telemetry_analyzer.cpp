// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/telemetry_analyzer.hpp>
#include <uplink/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace uplink::core {

namespace {

double clamp01(double value) noexcept {
    if (!std::isfinite(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

double clamp_ratio(double value, double fallback) noexcept {
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : fallback;
}

double elapsed_ms(Clock::time_point from, Clock::time_point to) noexcept {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

// Coefficient of variation (stddev / mean); a range with no throughput reads as 1
template <typename It>
double coefficient_of_variation(It first, It last) noexcept {
    auto n = static_cast<double>(std::distance(first, last));
    if (n <= 0.0) return 1.0;

    double sum = 0.0;
    for (auto it = first; it != last; ++it) sum += it->throughput_bps;
    double mean = sum / n;
    if (mean <= 0.0) return 1.0;

    double sq = 0.0;
    for (auto it = first; it != last; ++it) {
        double d = it->throughput_bps - mean;
        sq += d * d;
    }
    return std::sqrt(sq / n) / mean;
}

} // namespace

TelemetryConfig TelemetryConfig::sanitized() const noexcept {
    TelemetryConfig c = *this;
    c.max_transfer_samples = std::max<std::size_t>(c.max_transfer_samples, 1);
    c.max_rtt_samples = std::max<std::size_t>(c.max_rtt_samples, 1);
    if (c.throughput_window.count() <= 0) c.throughput_window = THROUGHPUT_WINDOW;
    c.stability_threshold = std::max<std::uint32_t>(c.stability_threshold, 1);
    if (!(c.stability_cv_threshold > 0.0)) c.stability_cv_threshold = STABILITY_CV_THRESHOLD;
    c.ema_alpha = clamp_ratio(c.ema_alpha, EMA_ALPHA);
    c.jitter_alpha = clamp_ratio(c.jitter_alpha, EMA_ALPHA);
    c.loss_correction = clamp_ratio(c.loss_correction, PACKET_LOSS_CORRECTION);
    c.trend_samples = std::max<std::size_t>(c.trend_samples, 2);
    if (!(c.improving_ratio >= 1.0)) c.improving_ratio = 1.2;
    if (!(c.degrading_ratio > 0.0 && c.degrading_ratio <= 1.0)) c.degrading_ratio = 0.8;
    c.rtt_variation_samples = std::max<std::size_t>(c.rtt_variation_samples, 2);
    c.success_rate_samples = std::max<std::size_t>(c.success_rate_samples, 1);
    c.extreme_packet_loss = clamp_ratio(c.extreme_packet_loss, EXTREME_PACKET_LOSS);
    if (!(c.extreme_rtt_variation_ms > 0.0)) c.extreme_rtt_variation_ms = EXTREME_RTT_VARIATION_MS;
    if (!(c.extreme_average_rtt_ms > 0.0)) c.extreme_average_rtt_ms = EXTREME_AVERAGE_RTT_MS;
    if (!(c.extreme_min_throughput_bps >= 0.0)) c.extreme_min_throughput_bps = EXTREME_MIN_THROUGHPUT_BPS;
    if (!(c.extreme_jitter_ms > 0.0)) c.extreme_jitter_ms = EXTREME_JITTER_MS;
    return c;
}

TelemetryAnalyzer::TelemetryAnalyzer(TelemetryConfig config, Clock::time_point start)
    : config_(config.sanitized())
    , last_sample_time_(start) {}

//=============================================================================
// Ingestion
//=============================================================================

void TelemetryAnalyzer::record_transfer(std::uint64_t bytes, bool success,
                                        std::optional<double> duration_ms,
                                        Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_transfer_locked(bytes, success, duration_ms, std::nullopt, now);
}

void TelemetryAnalyzer::record_transfer_locked(std::uint64_t bytes, bool success,
                                               std::optional<double> duration_ms,
                                               std::optional<double> latency_ms,
                                               Clock::time_point now) {
    double duration = (duration_ms && *duration_ms > 0.0)
        ? *duration_ms
        : std::max(0.0, elapsed_ms(last_sample_time_, now));

    TransferSample sample;
    sample.timestamp = now;
    sample.bytes = bytes;
    sample.duration_ms = duration;
    sample.throughput_bps = duration > 0.0 ? static_cast<double>(bytes) * 1000.0 / duration : 0.0;
    sample.success = success;
    sample.latency_ms = latency_ms;

    transfers_.push_back(sample);
    while (transfers_.size() > config_.max_transfer_samples) {
        transfers_.pop_front();
    }
    last_sample_time_ = now;
}

void TelemetryAnalyzer::update_rtt_sample(double rtt_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_rtt_locked(rtt_ms);
}

void TelemetryAnalyzer::update_rtt_locked(double rtt_ms) {
    if (!std::isfinite(rtt_ms) || rtt_ms < 0.0) return;

    if (rtts_.empty()) {
        stats_.jitter_ms = 0.0;
    } else {
        double delta = std::abs(rtt_ms - rtts_.back());
        stats_.jitter_ms = stats_.jitter_ms * (1.0 - config_.jitter_alpha) + delta * config_.jitter_alpha;
    }

    rtts_.push_back(rtt_ms);
    while (rtts_.size() > config_.max_rtt_samples) {
        rtts_.pop_front();
    }
}

void TelemetryAnalyzer::chunk_started(const std::string& chunk_id, std::uint64_t bytes,
                                      Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    inflight_[chunk_id] = InflightChunk{now, bytes};

    // Chunks that never report back must not pile up
    while (inflight_.size() > MAX_INFLIGHT_CHUNKS) {
        auto oldest = std::min_element(inflight_.begin(), inflight_.end(),
            [](const auto& a, const auto& b) { return a.second.started < b.second.started; });
        inflight_.erase(oldest);
    }
}

std::optional<double> TelemetryAnalyzer::chunk_finished(const std::string& chunk_id, bool success,
                                                        Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inflight_.find(chunk_id);
    if (it == inflight_.end()) {
        return std::nullopt;
    }

    auto chunk = it->second;
    inflight_.erase(it);

    double rtt = std::max(0.0, elapsed_ms(chunk.started, now));
    update_rtt_locked(rtt);
    record_transfer_locked(chunk.bytes, success, rtt, rtt, now);
    return rtt;
}

//=============================================================================
// Recomputation
//=============================================================================

void TelemetryAnalyzer::recompute_stats(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    update_current_throughput(now);
    update_stability();
    update_packet_loss();
    update_trend();

    if (rtts_.size() >= 2) {
        auto count = std::min(config_.rtt_variation_samples, rtts_.size());
        auto first = rtts_.end() - static_cast<std::ptrdiff_t>(count);
        auto [lo, hi] = std::minmax_element(first, rtts_.end());
        stats_.rtt_variation_ms = *hi - *lo;
    }
    stats_.average_rtt_ms = average_rtt_locked();
}

void TelemetryAnalyzer::update_current_throughput(Clock::time_point now) {
    auto window_start = now - config_.throughput_window;

    std::uint64_t bytes = 0;
    double duration = 0.0;
    std::size_t count = 0;
    for (const auto& s : transfers_) {
        if (s.timestamp > window_start) {
            bytes += s.bytes;
            duration += s.duration_ms;
            ++count;
        }
    }

    // Too little data: hold the previous value
    if (count < 2 || duration <= 0.0) {
        return;
    }

    double current = static_cast<double>(bytes) * 1000.0 / duration;
    stats_.current_throughput = current;

    if (!has_current_) {
        stats_.average_throughput = current;
        has_current_ = true;
    } else {
        stats_.average_throughput = stats_.average_throughput * (1.0 - config_.ema_alpha)
                                  + current * config_.ema_alpha;
    }
    stats_.peak_throughput = std::max(stats_.peak_throughput, current);
}

void TelemetryAnalyzer::update_stability() {
    if (transfers_.empty()) {
        return;
    }

    auto count = std::min<std::size_t>(config_.stability_threshold, transfers_.size());
    auto first = transfers_.end() - static_cast<std::ptrdiff_t>(count);
    double cv = coefficient_of_variation(first, transfers_.end());

    bool was_stable = stats_.is_stable;
    if (cv < config_.stability_cv_threshold) {
        ++consecutive_stable_;
        if (consecutive_stable_ >= config_.stability_threshold) {
            stats_.is_stable = true;
        }
    } else {
        consecutive_stable_ = 0;
        stats_.is_stable = false;
    }

    if (was_stable != stats_.is_stable) {
        log::get("telemetry")->debug("throughput {} (cv {:.3f})",
                                     stats_.is_stable ? "stabilized" : "became unstable", cv);
    }
}

void TelemetryAnalyzer::update_packet_loss() {
    stats_.packet_loss = clamp01((1.0 - success_rate_locked()) * config_.loss_correction);
}

void TelemetryAnalyzer::update_trend() {
    if (transfers_.size() < config_.trend_samples) {
        return;
    }

    auto count = static_cast<std::ptrdiff_t>(config_.trend_samples);
    auto first = transfers_.end() - count;
    auto middle = first + count / 2;

    auto average = [](auto b, auto e) {
        double sum = 0.0;
        std::ptrdiff_t n = 0;
        for (; b != e; ++b, ++n) sum += b->throughput_bps;
        return n > 0 ? sum / static_cast<double>(n) : 0.0;
    };

    double older = average(first, middle);
    double newer = average(middle, transfers_.end());
    if (older <= 0.0) {
        return;
    }

    double ratio = newer / older;
    auto trend = ThroughputTrend::stable;
    if (ratio > config_.improving_ratio) {
        trend = ThroughputTrend::improving;
    } else if (ratio < config_.degrading_ratio) {
        trend = ThroughputTrend::degrading;
    }

    if (trend != stats_.trend) {
        log::get("telemetry")->debug("throughput trend {} -> {} (ratio {:.2f})",
                                     to_string(stats_.trend), to_string(trend), ratio);
        stats_.trend = trend;
    }
}

//=============================================================================
// Queries
//=============================================================================

PerformanceStats TelemetryAnalyzer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

bool TelemetryAnalyzer::extreme_conditions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extreme_locked();
}

bool TelemetryAnalyzer::extreme_locked() const noexcept {
    return stats_.packet_loss > config_.extreme_packet_loss
        || stats_.rtt_variation_ms > config_.extreme_rtt_variation_ms
        || average_rtt_locked() > config_.extreme_average_rtt_ms
        || stats_.current_throughput < config_.extreme_min_throughput_bps
        || stats_.jitter_ms > config_.extreme_jitter_ms;
}

double TelemetryAnalyzer::average_rtt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return average_rtt_locked();
}

double TelemetryAnalyzer::average_rtt_locked() const noexcept {
    if (rtts_.empty()) return 0.0;
    return std::accumulate(rtts_.begin(), rtts_.end(), 0.0) / static_cast<double>(rtts_.size());
}

RttTrend TelemetryAnalyzer::rtt_trend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rtts_.size() < 3) {
        return RttTrend::stable;
    }

    double step = (rtts_.back() - rtts_.front()) / static_cast<double>(rtts_.size() - 1);
    if (step > 10.0) return RttTrend::increasing;
    if (step < -10.0) return RttTrend::decreasing;
    return RttTrend::stable;
}

double TelemetryAnalyzer::recent_success_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return success_rate_locked();
}

double TelemetryAnalyzer::success_rate_locked() const noexcept {
    if (transfers_.empty()) return 1.0;

    auto count = std::min(config_.success_rate_samples, transfers_.size());
    auto first = transfers_.end() - static_cast<std::ptrdiff_t>(count);
    auto ok = std::count_if(first, transfers_.end(), [](const auto& s) { return s.success; });
    return static_cast<double>(ok) / static_cast<double>(count);
}

std::size_t TelemetryAnalyzer::transfer_sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

std::size_t TelemetryAnalyzer::rtt_sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rtts_.size();
}

std::size_t TelemetryAnalyzer::inflight_chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.size();
}

std::vector<TransferSample> TelemetryAnalyzer::transfer_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {transfers_.begin(), transfers_.end()};
}

void TelemetryAnalyzer::reset(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    transfers_.clear();
    rtts_.clear();
    inflight_.clear();
    stats_ = PerformanceStats{};
    last_sample_time_ = now;
    consecutive_stable_ = 0;
    has_current_ = false;
}

} // namespace uplink::core
