// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/concurrency_controller.hpp>
#include <uplink/core/endpoint_selector.hpp>
#include <uplink/core/parameter_adjuster.hpp>
#include <uplink/core/quality_evaluator.hpp>
#include <uplink/core/session_config.hpp>
#include <uplink/core/task_scheduler.hpp>
#include <uplink/core/telemetry_analyzer.hpp>
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace uplink::core {

// Result of one control round
struct SessionTick {
    QualityAssessment assessment;
    PerformanceStats stats;
    bool extreme_conditions{false};
    std::optional<ConcurrencyChange> change;
    UploadParameters parameters;
    std::uint32_t effective_concurrency{0};
};

// Per-uploader control loop. Owns one instance of every component, turns raw
// upload lifecycle events into telemetry and applies decisions to the scheduler.
class AdaptiveSession {
public:
    explicit AdaptiveSession(SessionConfig config = {},
                             TaskScheduler* scheduler = nullptr,
                             std::shared_ptr<EndpointProber> prober = nullptr,
                             Clock::time_point start = Clock::now());
    ~AdaptiveSession();

    AdaptiveSession(const AdaptiveSession&) = delete;
    AdaptiveSession& operator=(const AdaptiveSession&) = delete;

    // Upload lifecycle events
    void on_chunk_uploaded(std::uint64_t bytes, double duration_ms,
                           std::optional<double> rtt_ms = std::nullopt,
                           const std::string& endpoint_id = {},
                           Clock::time_point now = Clock::now());
    void on_chunk_error(std::optional<std::uint64_t> bytes, std::uint32_t retry_count,
                        const std::string& endpoint_id = {},
                        Clock::time_point now = Clock::now());
    void on_connectivity_change(bool online, Clock::time_point now = Clock::now());

    // recompute -> assess -> controller tick -> parameter refresh -> apply
    SessionTick tick(Clock::time_point now = Clock::now());

    // Periodic ticks on a background thread, one per adaptation interval
    void start();
    void stop();

    [[nodiscard]] EndpointSelector::Selection select_endpoint(std::uint64_t payload_size = 0) const;

    [[nodiscard]] UploadParameters parameters() const;
    [[nodiscard]] QualityAssessment assessment() const;
    [[nodiscard]] std::uint32_t effective_concurrency() const;
    [[nodiscard]] bool online() const;

    [[nodiscard]] TelemetryAnalyzer& telemetry() noexcept { return telemetry_; }
    [[nodiscard]] ConcurrencyController& controller() noexcept { return controller_; }
    [[nodiscard]] ParameterAdjuster& adjuster() noexcept { return adjuster_; }
    [[nodiscard]] EndpointSelector& selector() noexcept { return selector_; }
    [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }

    // Snapshot of every component's state
    [[nodiscard]] nlohmann::json report() const;

    void dispose();

private:
    [[nodiscard]] std::uint32_t reconcile(std::uint32_t controller_value,
                                          const QualityAssessment& quality,
                                          const UploadParameters& params) const noexcept;
    void apply_concurrency(std::uint32_t value);

    SessionConfig config_;
    TaskScheduler* scheduler_;

    TelemetryAnalyzer telemetry_;
    QualityEvaluator evaluator_;
    ConcurrencyController controller_;
    ParameterAdjuster adjuster_;
    EndpointSelector selector_;

    mutable std::mutex mutex_;
    UploadParameters params_;
    QualityAssessment assessment_;
    std::uint32_t effective_{0};
    bool online_{true};

    std::mutex loop_mutex_;
    std::condition_variable_any loop_cv_;
    std::jthread loop_;
};

// JSON conversions, found by nlohmann::json through ADL
void to_json(nlohmann::json& j, const PerformanceStats& stats);
void to_json(nlohmann::json& j, const QualityAssessment& quality);
void to_json(nlohmann::json& j, const UploadParameters& params);
void to_json(nlohmann::json& j, const EndpointCandidate& candidate);
void to_json(nlohmann::json& j, const ConcurrencyStats& stats);
void to_json(nlohmann::json& j, const ConcurrencyChange& change);

} // namespace uplink::core
