// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/concurrency_controller.hpp>
#include <uplink/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace uplink::core {

ConcurrencyConfig ConcurrencyConfig::sanitized() const noexcept {
    ConcurrencyConfig c = *this;
    c.min_concurrency = std::clamp<std::uint32_t>(c.min_concurrency, 1, CONCURRENCY_CEILING);
    c.max_concurrency = std::clamp<std::uint32_t>(c.max_concurrency, c.min_concurrency, CONCURRENCY_CEILING);
    c.base_concurrency = std::clamp(c.base_concurrency, c.min_concurrency, c.max_concurrency);
    if (c.adaptation_interval.count() <= 0) c.adaptation_interval = ADAPTATION_INTERVAL;
    c.aggressiveness = std::isfinite(c.aggressiveness) ? std::clamp(c.aggressiveness, 0.0, 1.0) : 0.5;
    c.ramp_up_step = std::max<std::uint32_t>(c.ramp_up_step, 1);
    c.ramp_down_step = std::max<std::uint32_t>(c.ramp_down_step, 1);
    c.exploration_rounds = std::max<std::uint32_t>(c.exploration_rounds, 1);
    c.exploration_stability = std::isfinite(c.exploration_stability) ? std::clamp(c.exploration_stability, 0.0, 1.0) : 0.8;
    c.exploration_increase_bias = std::isfinite(c.exploration_increase_bias) ? std::clamp(c.exploration_increase_bias, 0.0, 1.0) : 0.7;
    c.noisy_stability = std::isfinite(c.noisy_stability) ? std::clamp(c.noisy_stability, 0.0, 1.0) : 0.7;
    c.performance_window = std::max<std::size_t>(c.performance_window, 2);
    c.max_performance_samples = std::max(c.max_performance_samples, c.performance_window);
    return c;
}

ConcurrencyController::ConcurrencyController(const TelemetryAnalyzer& telemetry,
                                             ConcurrencyConfig config,
                                             TaskScheduler* scheduler)
    : telemetry_(telemetry)
    , config_(config.sanitized())
    , scheduler_(scheduler)
    , base_(config_.base_concurrency)
    , current_(config_.base_concurrency)
    , rng_(config_.seed != 0 ? config_.seed : std::random_device{}()) {}

ConcurrencyController::~ConcurrencyController() {
    stop_adaptation();
}

//=============================================================================
// Recommendation
//=============================================================================

std::uint32_t ConcurrencyController::clamp(std::int64_t value) const noexcept {
    return static_cast<std::uint32_t>(std::clamp<std::int64_t>(
        value, config_.min_concurrency, config_.max_concurrency));
}

std::uint32_t ConcurrencyController::tier_concurrency(NetworkQualityTier tier) const noexcept {
    double max = static_cast<double>(config_.max_concurrency);
    double value = 0.0;
    switch (tier) {
        case NetworkQualityTier::excellent: value = max; break;
        case NetworkQualityTier::good: value = std::floor(max * 0.8); break;
        case NetworkQualityTier::moderate: value = std::floor(max * 0.6); break;
        case NetworkQualityTier::low: value = std::floor(max * 0.5); break;
        case NetworkQualityTier::poor: value = std::floor(max * 0.4); break;
        case NetworkQualityTier::very_poor: value = std::floor(max * 0.25); break;
        case NetworkQualityTier::offline: value = config_.min_concurrency; break;
    }
    return clamp(static_cast<std::int64_t>(value));
}

double ConcurrencyController::performance_adjustment() const noexcept {
    if (samples_.size() < 2) {
        return 0.0;
    }

    auto count = std::min(config_.performance_window, samples_.size());
    const auto& first = samples_[samples_.size() - count];
    const auto& last = samples_.back();

    bool concurrency_rose = last.concurrency > first.concurrency;
    bool throughput_rose = concurrency_rose && last.throughput > first.throughput * 1.1;
    bool latency_spiked = concurrency_rose && last.latency > first.latency * 1.5;

    // Latency growing faster than the extra load explains
    bool disproportionate = false;
    if (first.latency > 0.0 && first.concurrency > 0) {
        double latency_ratio = last.latency / first.latency;
        double concurrency_ratio = static_cast<double>(last.concurrency) / static_cast<double>(first.concurrency);
        disproportionate = latency_ratio > 1.5 * concurrency_ratio;
    }

    if (throughput_rose && !latency_spiked) {
        return static_cast<double>(config_.ramp_up_step) * config_.aggressiveness;
    }
    if (disproportionate) {
        return -static_cast<double>(config_.ramp_down_step) * config_.aggressiveness;
    }
    return 0.0;
}

bool ConcurrencyController::sustained_poor() const noexcept {
    if (samples_.size() < 2) {
        return false;
    }

    const auto& last = samples_.back();
    const auto& previous = samples_[samples_.size() - 2];
    if (last.tier > NetworkQualityTier::poor || previous.tier > NetworkQualityTier::poor) {
        return false;
    }

    auto count = std::min(config_.performance_window, samples_.size());
    const auto& first = samples_[samples_.size() - count];
    return !(last.throughput > first.throughput * 1.1);
}

std::uint32_t ConcurrencyController::compute_recommended(NetworkQualityTier tier) const noexcept {
    double value = static_cast<double>(tier_concurrency(tier)) + performance_adjustment();
    auto recommended = static_cast<std::int64_t>(std::lround(value));

    // A poor link that is not recovering keeps shedding load down to the minimum
    if (sustained_poor()) {
        auto step = std::max<std::int64_t>(
            1, std::lround(static_cast<double>(config_.ramp_down_step) * config_.aggressiveness));
        recommended = std::min<std::int64_t>(recommended, static_cast<std::int64_t>(current_) - step);
    }
    return clamp(recommended);
}

void ConcurrencyController::add_performance_sample(NetworkQualityTier tier) {
    auto stats = telemetry_.stats();
    samples_.push_back(PerformanceSample{current_, stats.current_throughput, stats.average_rtt_ms, tier});
    while (samples_.size() > config_.max_performance_samples) {
        samples_.pop_front();
    }
}

void ConcurrencyController::update_stability_score() {
    if (samples_.size() < 3) {
        return;
    }

    auto count = std::min(config_.performance_window, samples_.size());
    auto first = samples_.end() - static_cast<std::ptrdiff_t>(count);

    double sum = 0.0;
    for (auto it = first; it != samples_.end(); ++it) sum += it->latency;
    double mean = sum / static_cast<double>(count);

    double sq = 0.0;
    for (auto it = first; it != samples_.end(); ++it) sq += (it->latency - mean) * (it->latency - mean);
    double cv = mean > 0.0 ? std::sqrt(sq / static_cast<double>(count)) / mean : 0.0;

    double raw = std::max(0.0, 1.0 - cv * 2.0);
    stability_score_ = std::clamp(stability_score_ * 0.7 + raw * 0.3, 0.0, 1.0);
}

bool ConcurrencyController::should_commit(std::uint32_t recommended, Clock::time_point now) const noexcept {
    if (recommended == current_) {
        return false;
    }
    if (!last_adaptation_) {
        return true;
    }

    auto diff = std::abs(static_cast<std::int64_t>(recommended) - static_cast<std::int64_t>(current_));
    if (diff >= 2) {
        return true;
    }

    // Noisy regime: single-step corrections once the interval has passed
    return now - *last_adaptation_ >= config_.adaptation_interval
        && stability_score_ <= config_.noisy_stability;
}

//=============================================================================
// State transitions
//=============================================================================

ConcurrencyChange ConcurrencyController::commit_locked(std::uint32_t value, ChangeReason reason,
                                                       NetworkQualityTier tier, Clock::time_point now) {
    ConcurrencyChange change{current_, clamp(value), reason, tier, now};
    current_ = change.current;
    last_adaptation_ = now;
    ++adaptation_count_;
    consecutive_unchanged_ = 0;

    log::get("concurrency")->debug("concurrency {} -> {} ({}, tier {}, stability {:.2f})",
                                   change.previous, change.current, to_string(reason),
                                   to_string(tier), stability_score_);
    return change;
}

std::optional<ConcurrencyChange> ConcurrencyController::degrade_locked(NetworkQualityTier tier,
                                                                       Clock::time_point now) {
    auto previous_tier = last_tier_;
    last_tier_ = tier;
    mode_ = ControllerMode::degraded;

    std::uint32_t reduction = std::min(2 * config_.ramp_down_step, current_ - config_.min_concurrency);
    log::get("concurrency")->info("quality dropped {} -> {}, backing off by {}",
                                  to_string(previous_tier), to_string(tier), reduction);
    if (reduction == 0) {
        return std::nullopt;
    }
    return commit_locked(current_ - reduction, ChangeReason::degraded, tier, now);
}

std::optional<ConcurrencyChange> ConcurrencyController::explore_locked(NetworkQualityTier tier,
                                                                       Clock::time_point now) {
    consecutive_unchanged_ = 0;
    mode_ = ControllerMode::exploring;

    std::bernoulli_distribution increase(config_.exploration_increase_bias);
    if (increase(rng_)) {
        if (current_ < config_.max_concurrency) {
            return commit_locked(current_ + 1, ChangeReason::exploration, tier, now);
        }
    } else if (current_ > config_.min_concurrency) {
        return commit_locked(current_ - 1, ChangeReason::exploration, tier, now);
    }
    return std::nullopt;
}

void ConcurrencyController::apply(const ConcurrencyChange& change) {
    TaskScheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler = scheduler_;
    }
    if (scheduler) {
        scheduler->set_concurrency(change.current);
    }
    changes_.publish(change);
}

std::optional<ConcurrencyChange> ConcurrencyController::tick(NetworkQualityTier tier, Clock::time_point now) {
    TaskScheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler = scheduler_;
    }
    // Nothing is dispatched while paused, so there is nothing to learn from
    if (scheduler && scheduler->is_paused()) {
        return std::nullopt;
    }

    std::optional<ConcurrencyChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        add_performance_sample(tier);

        int distance = tier_distance(last_tier_, tier);
        if (distance <= -2) {
            change = degrade_locked(tier, now);
        } else {
            last_tier_ = tier;
            mode_ = ControllerMode::adapting;
            auto recommended = compute_recommended(tier);
            update_stability_score();

            bool backing_off = recommended < current_ && sustained_poor()
                && (!last_adaptation_ || now - *last_adaptation_ >= config_.adaptation_interval);
            if (should_commit(recommended, now) || backing_off) {
                auto reason = distance >= 2 ? ChangeReason::quality_change : ChangeReason::performance;
                change = commit_locked(recommended, reason, tier, now);
            } else {
                ++consecutive_unchanged_;
                if (config_.exploration_enabled
                    && consecutive_unchanged_ > config_.exploration_rounds
                    && stability_score_ > config_.exploration_stability
                    && tier >= NetworkQualityTier::moderate) {
                    change = explore_locked(tier, now);
                }
            }
        }
    }

    if (change) {
        apply(*change);
    }
    return change;
}

std::optional<ConcurrencyChange> ConcurrencyController::observe_quality(NetworkQualityTier tier,
                                                                        Clock::time_point now) {
    std::optional<ConcurrencyChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tier_distance(last_tier_, tier) > -2) {
            return std::nullopt;
        }
        change = degrade_locked(tier, now);
    }

    if (change) {
        apply(*change);
    }
    return change;
}

std::optional<ConcurrencyChange> ConcurrencyController::adjust_for_quality(NetworkQualityTier tier,
                                                                           Clock::time_point now) {
    std::optional<ConcurrencyChange> change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_tier_ = tier;
        auto recommended = compute_recommended(tier);
        if (recommended != current_) {
            mode_ = ControllerMode::adapting;
            change = commit_locked(recommended, ChangeReason::quality_change, tier, now);
        }
    }

    if (change) {
        apply(*change);
    }
    return change;
}

void ConcurrencyController::set_concurrency_manually(std::uint32_t n, bool temporary) {
    ConcurrencyChange change;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto value = clamp(n);
        if (!temporary) {
            base_ = value;
        }
        change = ConcurrencyChange{current_, value, ChangeReason::manual, last_tier_, Clock::now()};
        current_ = value;
        log::get("concurrency")->debug("manual concurrency {} -> {}{}", change.previous, value,
                                       temporary ? " (temporary)" : "");
    }
    apply(change);
}

//=============================================================================
// Periodic adaptation
//=============================================================================

void ConcurrencyController::start_adaptation(TierSource tier_source) {
    stop_adaptation();

    timer_ = std::jthread([this, source = std::move(tier_source)](std::stop_token stop) {
        while (!stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(timer_mutex_);
                timer_cv_.wait_for(lock, stop, config_.adaptation_interval, [] { return false; });
            }
            if (stop.stop_requested()) {
                break;
            }
            auto now = Clock::now();
            tick(source(now), now);
        }
    });
}

void ConcurrencyController::stop_adaptation() {
    if (timer_.joinable()) {
        timer_.request_stop();
        timer_.join();
    }
}

//=============================================================================
// Bookkeeping and queries
//=============================================================================

void ConcurrencyController::record_request_started() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_requests_;
}

void ConcurrencyController::record_request_finished(double latency_ms, bool success,
                                                    double throughput_bps) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_requests_ > 0) {
        --active_requests_;
    }
    if (success) {
        ++completed_requests_;
        latency_sum_ += latency_ms;
        max_throughput_ = std::max(max_throughput_, throughput_bps);
    } else {
        ++failed_requests_;
    }
}

std::uint32_t ConcurrencyController::recommended_concurrency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::uint32_t ConcurrencyController::base_concurrency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_;
}

ControllerMode ConcurrencyController::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

ConcurrencyStats ConcurrencyController::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ConcurrencyStats s;
    s.current_concurrency = current_;
    s.recommended_concurrency = compute_recommended(last_tier_);
    s.active_requests = active_requests_;
    s.max_achieved_throughput = max_throughput_;
    s.average_latency_ms = completed_requests_ > 0 ? latency_sum_ / static_cast<double>(completed_requests_) : 0.0;
    auto total = completed_requests_ + failed_requests_;
    s.failure_rate = total > 0 ? static_cast<double>(failed_requests_) / static_cast<double>(total) : 0.0;
    s.adaptation_count = adaptation_count_;
    s.last_adaptation = last_adaptation_;
    s.stability_score = stability_score_;
    s.consecutive_unchanged_rounds = consecutive_unchanged_;
    s.mode = mode_;
    s.last_tier = last_tier_;
    return s;
}

void ConcurrencyController::set_scheduler(TaskScheduler* scheduler) {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_ = scheduler;
}

void ConcurrencyController::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = base_;
    last_tier_ = NetworkQualityTier::good;
    mode_ = ControllerMode::idle;
    last_adaptation_.reset();
    adaptation_count_ = 0;
    stability_score_ = 1.0;
    consecutive_unchanged_ = 0;
    samples_.clear();
    active_requests_ = 0;
    completed_requests_ = 0;
    failed_requests_ = 0;
    latency_sum_ = 0.0;
    max_throughput_ = 0.0;
}

} // namespace uplink::core
