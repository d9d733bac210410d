// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/change_channel.hpp>
#include <uplink/core/config.hpp>
#include <uplink/core/network_quality.hpp>
#include <uplink/core/task_scheduler.hpp>
#include <uplink/core/telemetry_analyzer.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <thread>

namespace uplink::core {

enum class ControllerMode : std::uint8_t {
    idle,       // No tick yet
    adapting,   // Steady state
    exploring,  // Probing a neighbouring concurrency after a long quiet run
    degraded    // Quality collapsed, fast backoff applied
};

enum class ChangeReason : std::uint8_t {
    performance,
    quality_change,
    degraded,
    exploration,
    manual
};

[[nodiscard]] constexpr std::string_view to_string(ControllerMode mode) noexcept {
    switch (mode) {
        case ControllerMode::idle: return "idle";
        case ControllerMode::adapting: return "adapting";
        case ControllerMode::exploring: return "exploring";
        case ControllerMode::degraded: return "degraded";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(ChangeReason reason) noexcept {
    switch (reason) {
        case ChangeReason::performance: return "performance";
        case ChangeReason::quality_change: return "quality_change";
        case ChangeReason::degraded: return "degraded";
        case ChangeReason::exploration: return "exploration";
        case ChangeReason::manual: return "manual";
    }
    return "unknown";
}

// Published on every committed concurrency change
struct ConcurrencyChange {
    std::uint32_t previous{0};
    std::uint32_t current{0};
    ChangeReason reason{ChangeReason::performance};
    NetworkQualityTier tier{NetworkQualityTier::good};
    Clock::time_point timestamp{};
};

struct ConcurrencyConfig {
    std::uint32_t min_concurrency{MIN_CONCURRENCY};
    std::uint32_t max_concurrency{MAX_CONCURRENCY};
    std::uint32_t base_concurrency{BASE_CONCURRENCY};
    std::chrono::milliseconds adaptation_interval{ADAPTATION_INTERVAL};
    double aggressiveness{0.5};                 // [0, 1], higher = faster concurrency swings
    std::uint32_t ramp_up_step{RAMP_UP_STEP};
    std::uint32_t ramp_down_step{RAMP_DOWN_STEP};
    std::uint32_t exploration_rounds{5};        // Unchanged rounds before exploring
    double exploration_stability{0.8};
    double exploration_increase_bias{0.7};
    double noisy_stability{0.7};                // At or below: small corrections allowed
    std::size_t performance_window{5};
    std::size_t max_performance_samples{50};
    bool exploration_enabled{true};
    std::uint32_t seed{0};                      // 0 = nondeterministic

    [[nodiscard]] ConcurrencyConfig sanitized() const noexcept;
};

struct ConcurrencyStats {
    std::uint32_t current_concurrency{0};
    std::uint32_t recommended_concurrency{0};
    std::uint32_t active_requests{0};
    double max_achieved_throughput{0.0};
    double average_latency_ms{0.0};
    double failure_rate{0.0};
    std::uint64_t adaptation_count{0};
    std::optional<Clock::time_point> last_adaptation;
    double stability_score{1.0};
    std::uint32_t consecutive_unchanged_rounds{0};
    ControllerMode mode{ControllerMode::idle};
    NetworkQualityTier last_tier{NetworkQualityTier::good};
};

// Feedback controller for the number of chunks in flight.
// Reads telemetry, never moves chunks: the scheduler enforces the result.
class ConcurrencyController {
public:
    using TierSource = std::function<NetworkQualityTier(Clock::time_point)>;

    explicit ConcurrencyController(const TelemetryAnalyzer& telemetry,
                                   ConcurrencyConfig config = {},
                                   TaskScheduler* scheduler = nullptr);
    ~ConcurrencyController();

    ConcurrencyController(const ConcurrencyController&) = delete;
    ConcurrencyController& operator=(const ConcurrencyController&) = delete;

    // One adaptation round; returns the committed change, if any
    std::optional<ConcurrencyChange> tick(NetworkQualityTier tier, Clock::time_point now = Clock::now());

    // Immediate reaction to a tier observation between ticks (Degraded entry)
    std::optional<ConcurrencyChange> observe_quality(NetworkQualityTier tier, Clock::time_point now = Clock::now());

    // Recompute for the tier and commit without hysteresis
    std::optional<ConcurrencyChange> adjust_for_quality(NetworkQualityTier tier, Clock::time_point now = Clock::now());

    // Periodic ticks on a background thread
    void start_adaptation(TierSource tier_source);
    void stop_adaptation();
    [[nodiscard]] bool is_adapting() const noexcept { return timer_.joinable(); }

    // A non-temporary override also becomes the new base concurrency
    void set_concurrency_manually(std::uint32_t n, bool temporary = false);

    void record_request_started() noexcept;
    void record_request_finished(double latency_ms, bool success, double throughput_bps) noexcept;

    [[nodiscard]] std::uint32_t recommended_concurrency() const;
    [[nodiscard]] std::uint32_t base_concurrency() const;
    [[nodiscard]] ConcurrencyStats stats() const;
    [[nodiscard]] ControllerMode mode() const;
    [[nodiscard]] const ConcurrencyConfig& config() const noexcept { return config_; }

    [[nodiscard]] ChangeChannel<ConcurrencyChange>::Subscription subscribe() { return changes_.subscribe(); }

    void set_scheduler(TaskScheduler* scheduler);
    void reset();

private:
    struct PerformanceSample {
        std::uint32_t concurrency;
        double throughput;
        double latency;
        NetworkQualityTier tier;
    };

    [[nodiscard]] std::uint32_t tier_concurrency(NetworkQualityTier tier) const noexcept;
    [[nodiscard]] double performance_adjustment() const noexcept;
    [[nodiscard]] bool sustained_poor() const noexcept;
    [[nodiscard]] std::uint32_t compute_recommended(NetworkQualityTier tier) const noexcept;
    [[nodiscard]] bool should_commit(std::uint32_t recommended, Clock::time_point now) const noexcept;
    [[nodiscard]] std::uint32_t clamp(std::int64_t value) const noexcept;

    void add_performance_sample(NetworkQualityTier tier);
    void update_stability_score();
    std::optional<ConcurrencyChange> degrade_locked(NetworkQualityTier tier, Clock::time_point now);
    std::optional<ConcurrencyChange> explore_locked(NetworkQualityTier tier, Clock::time_point now);
    ConcurrencyChange commit_locked(std::uint32_t value, ChangeReason reason,
                                    NetworkQualityTier tier, Clock::time_point now);
    void apply(const ConcurrencyChange& change);

    const TelemetryAnalyzer& telemetry_;
    ConcurrencyConfig config_;

    mutable std::mutex mutex_;
    TaskScheduler* scheduler_{nullptr};
    std::uint32_t base_;
    std::uint32_t current_;
    NetworkQualityTier last_tier_{NetworkQualityTier::good};
    ControllerMode mode_{ControllerMode::idle};
    std::optional<Clock::time_point> last_adaptation_;
    std::uint64_t adaptation_count_{0};
    double stability_score_{1.0};
    std::uint32_t consecutive_unchanged_{0};
    std::deque<PerformanceSample> samples_;
    std::mt19937 rng_;

    // Request bookkeeping
    std::uint32_t active_requests_{0};
    std::uint64_t completed_requests_{0};
    std::uint64_t failed_requests_{0};
    double latency_sum_{0.0};
    double max_throughput_{0.0};

    ChangeChannel<ConcurrencyChange> changes_;

    std::mutex timer_mutex_;
    std::condition_variable_any timer_cv_;
    std::jthread timer_;
};

} // namespace uplink::core
