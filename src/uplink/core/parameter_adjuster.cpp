// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/parameter_adjuster.hpp>
#include <uplink/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace uplink::core {

namespace {

constexpr std::uint32_t UNSTABLE_MAX_CONCURRENCY = 2;
constexpr std::uint32_t UNSTABLE_MIN_RETRIES = 4;
constexpr std::uint32_t UNSTABLE_MIN_RETRY_DELAY_MS = 1500;
constexpr std::uint32_t UNSTABLE_MIN_TIMEOUT_MS = 45000;
constexpr double UNSTABLE_CHUNK_FACTOR = 0.75;

constexpr double MAX_CHUNK_GROWTH = 2.0;
constexpr double MAX_CHUNK_SHRINK = 0.5;
constexpr std::uint32_t MAX_CONCURRENCY_STEP = 2;

} // namespace

UploadParameters default_preset(NetworkQualityTier tier) noexcept {
    switch (tier) {
        case NetworkQualityTier::offline:
            return {MIN_CHUNK_SIZE, 1, 5, 1000, 60000, true, false};
        case NetworkQualityTier::very_poor:
            return {128 * 1024, 1, 5, 2000, 60000, true, false};
        case NetworkQualityTier::poor:
            return {256 * 1024, 2, 4, 1500, 45000, true, true};
        case NetworkQualityTier::low:
            return {384 * 1024, 2, 4, 1200, 40000, true, true};
        case NetworkQualityTier::moderate:
            return {512 * 1024, 3, 3, 1000, 30000, true, true};
        case NetworkQualityTier::good:
            return {1024 * 1024, 4, 2, 800, 20000, true, true};
        case NetworkQualityTier::excellent:
            return {2 * 1024 * 1024, 6, 1, 500, 15000, true, true};
    }
    return {};
}

AdjusterConfig AdjusterConfig::sanitized() const noexcept {
    AdjusterConfig c = *this;
    c.min_chunk_size = std::max<std::uint64_t>(c.min_chunk_size, 1024);
    c.max_chunk_size = std::max(c.max_chunk_size, c.min_chunk_size);
    c.min_concurrency = std::max<std::uint32_t>(c.min_concurrency, 1);
    c.max_concurrency = std::clamp(c.max_concurrency, c.min_concurrency, CONCURRENCY_CEILING);
    c.history_size = std::max<std::size_t>(c.history_size, 1);
    c.learning_min_samples = std::max<std::size_t>(c.learning_min_samples, 1);
    if (!(c.learning_gain >= 1.0) || !std::isfinite(c.learning_gain)) c.learning_gain = 1.2;
    return c;
}

ParameterAdjuster::ParameterAdjuster(AdjusterConfig config)
    : config_(config.sanitized()) {
    for (std::size_t i = 0; i < TIER_COUNT; ++i) {
        auto tier = static_cast<NetworkQualityTier>(i);
        presets_[i] = config_.preset_overrides[i].value_or(default_preset(tier));
    }
}

const UploadParameters& ParameterAdjuster::preset(NetworkQualityTier tier) const noexcept {
    return presets_[static_cast<std::size_t>(tier)];
}

//=============================================================================
// Recommendation
//=============================================================================

UploadParameters ParameterAdjuster::recommended_parameters(const QualityAssessment& quality) const {
    auto params = preset(quality.tier);
    if (config_.adaptive_learning) {
        params = learned(params, quality.tier);
    }
    return validate_parameters(params);
}

UploadParameters ParameterAdjuster::learned(UploadParameters base, NetworkQualityTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const HistoricalOutcome*> relevant;
    for (const auto& outcome : history_) {
        if (outcome.tier == tier && outcome.success && outcome.transfer_rate) {
            relevant.push_back(&outcome);
        }
    }
    if (relevant.size() < config_.learning_min_samples) {
        return base;
    }

    double sum = 0.0;
    const HistoricalOutcome* best = relevant.front();
    for (const auto* outcome : relevant) {
        sum += *outcome->transfer_rate;
        if (*outcome->transfer_rate > *best->transfer_rate) {
            best = outcome;
        }
    }
    double average = sum / static_cast<double>(relevant.size());

    if (*best->transfer_rate > average * config_.learning_gain) {
        log::get("params")->debug("learned {} chunk {} concurrency {} ({:.0f} B/s vs avg {:.0f})",
                                  to_string(tier), best->parameters.chunk_size,
                                  best->parameters.concurrency, *best->transfer_rate, average);
        base.chunk_size = best->parameters.chunk_size;
        base.concurrency = best->parameters.concurrency;
    }
    return base;
}

UploadParameters ParameterAdjuster::adjust_parameters(const QualityAssessment& quality,
                                                      const UploadParameters& current) const {
    auto recommended = recommended_parameters(quality);
    if (quality.is_unstable) {
        return conservative(recommended, current);
    }
    return validate_parameters(smooth(current, recommended));
}

UploadParameters ParameterAdjuster::conservative(const UploadParameters& recommended,
                                                 const UploadParameters& current) const noexcept {
    UploadParameters p;
    p.chunk_size = static_cast<std::uint64_t>(std::llround(
        static_cast<double>(std::min(current.chunk_size, recommended.chunk_size)) * UNSTABLE_CHUNK_FACTOR));
    p.concurrency = std::min({current.concurrency, recommended.concurrency, UNSTABLE_MAX_CONCURRENCY});
    p.retry_count = std::max({current.retry_count, recommended.retry_count, UNSTABLE_MIN_RETRIES});
    p.retry_delay_ms = std::max({current.retry_delay_ms, recommended.retry_delay_ms, UNSTABLE_MIN_RETRY_DELAY_MS});
    p.timeout_ms = std::max({current.timeout_ms, recommended.timeout_ms, UNSTABLE_MIN_TIMEOUT_MS});
    p.precheck_enabled = true;
    p.use_worker = current.use_worker;
    return validate_parameters(p);
}

UploadParameters ParameterAdjuster::smooth(const UploadParameters& current,
                                           const UploadParameters& target) const noexcept {
    UploadParameters p = target;

    if (current.chunk_size > 0) {
        double current_chunk = static_cast<double>(current.chunk_size);
        double ratio = static_cast<double>(target.chunk_size) / current_chunk;
        if (ratio > MAX_CHUNK_GROWTH) {
            p.chunk_size = static_cast<std::uint64_t>(std::llround(current_chunk * MAX_CHUNK_GROWTH));
        } else if (ratio < MAX_CHUNK_SHRINK) {
            p.chunk_size = static_cast<std::uint64_t>(std::llround(current_chunk * MAX_CHUNK_SHRINK));
        }
    }

    auto diff = static_cast<std::int64_t>(target.concurrency) - static_cast<std::int64_t>(current.concurrency);
    if (diff > static_cast<std::int64_t>(MAX_CONCURRENCY_STEP)) {
        p.concurrency = current.concurrency + MAX_CONCURRENCY_STEP;
    } else if (diff < -static_cast<std::int64_t>(MAX_CONCURRENCY_STEP)) {
        p.concurrency = current.concurrency - MAX_CONCURRENCY_STEP;
    }
    return p;
}

UploadParameters ParameterAdjuster::validate_parameters(UploadParameters params) const noexcept {
    params.chunk_size = std::clamp(params.chunk_size, config_.min_chunk_size, config_.max_chunk_size);
    params.concurrency = std::clamp(params.concurrency, config_.min_concurrency, config_.max_concurrency);
    params.retry_delay_ms = std::max(params.retry_delay_ms, MIN_RETRY_DELAY_MS);
    params.timeout_ms = std::max(params.timeout_ms, MIN_TIMEOUT_MS);
    return params;
}

UploadParameters ParameterAdjuster::minimum_safe_parameters() const noexcept {
    return {config_.min_chunk_size, config_.min_concurrency, 5, 1000, 60000, true, false};
}

//=============================================================================
// History
//=============================================================================

void ParameterAdjuster::record_upload_result(const QualityAssessment& quality,
                                             const UploadParameters& parameters,
                                             bool success, std::optional<double> transfer_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(HistoricalOutcome{quality.tier, parameters, success, transfer_rate});
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }
}

void ParameterAdjuster::reset_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

std::vector<HistoricalOutcome> ParameterAdjuster::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

} // namespace uplink::core
