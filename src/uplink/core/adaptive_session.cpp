// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/adaptive_session.hpp>
#include <uplink/core/log.hpp>
#include <algorithm>

namespace uplink::core {

AdaptiveSession::AdaptiveSession(SessionConfig config,
                                 TaskScheduler* scheduler,
                                 std::shared_ptr<EndpointProber> prober,
                                 Clock::time_point start)
    : config_(config.sanitized())
    , scheduler_(scheduler)
    , telemetry_(config_.telemetry, start)
    , controller_(telemetry_, config_.concurrency)
    , adjuster_(config_.adjuster)
    , selector_(config_.selector, std::move(prober)) {
    for (const auto& endpoint : config_.endpoints) {
        if (auto added = selector_.add_candidate(endpoint); !added) {
            log::get("session")->warn("skipping endpoint {}: {}", endpoint.id, added.error().message());
        }
    }

    params_ = adjuster_.validate_parameters(adjuster_.preset(NetworkQualityTier::moderate));
    assessment_.timestamp = start;
    effective_ = reconcile(controller_.recommended_concurrency(), assessment_, params_);
    params_.concurrency = effective_;
}

AdaptiveSession::~AdaptiveSession() {
    dispose();
}

//=============================================================================
// Lifecycle events
//=============================================================================

void AdaptiveSession::on_chunk_uploaded(std::uint64_t bytes, double duration_ms,
                                        std::optional<double> rtt_ms,
                                        const std::string& endpoint_id,
                                        Clock::time_point now) {
    telemetry_.record_transfer(bytes, true, duration_ms, now);
    if (rtt_ms) {
        telemetry_.update_rtt_sample(*rtt_ms);
    }

    double rate = duration_ms > 0.0 ? static_cast<double>(bytes) * 1000.0 / duration_ms : 0.0;
    controller_.record_request_finished(rtt_ms.value_or(duration_ms), true, rate);

    if (!endpoint_id.empty()) {
        selector_.record_outcome(endpoint_id, true, rtt_ms.value_or(duration_ms));
    }

    QualityAssessment quality;
    UploadParameters params;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quality = assessment_;
        params = params_;
    }
    adjuster_.record_upload_result(quality, params, true, rate);
}

void AdaptiveSession::on_chunk_error(std::optional<std::uint64_t> bytes, std::uint32_t retry_count,
                                     const std::string& endpoint_id,
                                     Clock::time_point now) {
    telemetry_.record_transfer(bytes.value_or(0), false, std::nullopt, now);
    controller_.record_request_finished(0.0, false, 0.0);

    if (!endpoint_id.empty()) {
        selector_.record_outcome(endpoint_id, false);
    }

    QualityAssessment quality;
    UploadParameters params;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quality = assessment_;
        params = params_;
    }
    adjuster_.record_upload_result(quality, params, false);

    log::get("session")->debug("chunk error ({} bytes, retry {})", bytes.value_or(0), retry_count);
}

void AdaptiveSession::on_connectivity_change(bool online, Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (online_ == online) {
            return;
        }
        online_ = online;
    }

    if (!online) {
        log::get("session")->info("connection lost, pausing uploads");
        if (auto change = controller_.observe_quality(NetworkQualityTier::offline, now); change) {
            apply_concurrency(change->current);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            params_ = adjuster_.minimum_safe_parameters();
            assessment_ = evaluator_.evaluate(telemetry_.stats(), telemetry_.extreme_conditions(), false, now);
        }
        if (scheduler_) {
            scheduler_->pause();
        }
    } else {
        log::get("session")->info("connection restored, resuming uploads");
        if (scheduler_) {
            scheduler_->resume();
        }
    }
}

//=============================================================================
// Control round
//=============================================================================

std::uint32_t AdaptiveSession::reconcile(std::uint32_t controller_value,
                                         const QualityAssessment& quality,
                                         const UploadParameters& params) const noexcept {
    const auto& bounds = adjuster_.config();
    auto value = std::clamp(controller_value, bounds.min_concurrency, bounds.max_concurrency);
    if (quality.is_unstable) {
        value = std::min(value, params.concurrency);
    }
    return value;
}

void AdaptiveSession::apply_concurrency(std::uint32_t value) {
    if (scheduler_ && scheduler_->concurrency() != value) {
        scheduler_->set_concurrency(value);
    }
}

SessionTick AdaptiveSession::tick(Clock::time_point now) {
    telemetry_.recompute_stats(now);

    SessionTick result;
    result.stats = telemetry_.stats();
    result.extreme_conditions = telemetry_.extreme_conditions();

    bool is_online = online();
    result.assessment = evaluator_.evaluate(result.stats, result.extreme_conditions, is_online, now);

    // Paused or offline: nothing is dispatched, so nothing to steer
    bool paused = !is_online || (scheduler_ && scheduler_->is_paused());
    if (!paused) {
        result.change = controller_.tick(result.assessment.tier, now);
    }

    UploadParameters current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = params_;
    }

    auto next = is_online ? adjuster_.adjust_parameters(result.assessment, current)
                          : adjuster_.minimum_safe_parameters();
    auto effective = reconcile(controller_.recommended_concurrency(), result.assessment, next);
    next.concurrency = effective;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        params_ = next;
        assessment_ = result.assessment;
        effective_ = effective;
    }
    if (!paused) {
        apply_concurrency(effective);
    }

    result.parameters = next;
    result.effective_concurrency = effective;

    log::get("session")->debug("tick: tier {} score {:.0f} concurrency {} chunk {}{}",
                               to_string(result.assessment.tier), result.assessment.score,
                               effective, next.chunk_size,
                               result.assessment.is_unstable ? " (unstable)" : "");
    return result;
}

void AdaptiveSession::start() {
    stop();

    loop_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(loop_mutex_);
                loop_cv_.wait_for(lock, stop, config_.concurrency.adaptation_interval, [] { return false; });
            }
            if (stop.stop_requested()) {
                break;
            }
            tick(Clock::now());
        }
    });
}

void AdaptiveSession::stop() {
    if (loop_.joinable()) {
        loop_.request_stop();
        loop_.join();
    }
}

void AdaptiveSession::dispose() {
    stop();
    controller_.stop_adaptation();
    selector_.dispose();
}

//=============================================================================
// Queries
//=============================================================================

EndpointSelector::Selection AdaptiveSession::select_endpoint(std::uint64_t payload_size) const {
    return selector_.select(assessment(), payload_size);
}

UploadParameters AdaptiveSession::parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_;
}

QualityAssessment AdaptiveSession::assessment() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assessment_;
}

std::uint32_t AdaptiveSession::effective_concurrency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return effective_;
}

bool AdaptiveSession::online() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return online_;
}

nlohmann::json AdaptiveSession::report() const {
    nlohmann::json j;
    j["online"] = online();
    j["assessment"] = assessment();
    j["telemetry"] = telemetry_.stats();
    j["telemetry"]["extreme_conditions"] = telemetry_.extreme_conditions();
    j["telemetry"]["rtt_trend"] = std::string(to_string(telemetry_.rtt_trend()));
    j["telemetry"]["success_rate"] = telemetry_.recent_success_rate();
    j["concurrency"] = controller_.stats();
    j["effective_concurrency"] = effective_concurrency();
    j["parameters"] = parameters();
    j["endpoints"] = selector_.candidates();
    return j;
}

//=============================================================================
// JSON conversions
//=============================================================================

void to_json(nlohmann::json& j, const PerformanceStats& s) {
    j = nlohmann::json{
        {"current_throughput", s.current_throughput},
        {"average_throughput", s.average_throughput},
        {"peak_throughput", s.peak_throughput},
        {"jitter_ms", s.jitter_ms},
        {"packet_loss", s.packet_loss},
        {"rtt_variation_ms", s.rtt_variation_ms},
        {"average_rtt_ms", s.average_rtt_ms},
        {"stable", s.is_stable},
        {"trend", std::string(to_string(s.trend))},
    };
}

void to_json(nlohmann::json& j, const QualityAssessment& q) {
    j = nlohmann::json{
        {"tier", std::string(to_string(q.tier))},
        {"score", q.score},
        {"throughput", q.throughput_bps},
        {"latency_ms", q.latency_ms},
        {"packet_loss", q.packet_loss},
        {"jitter_ms", q.jitter_ms},
        {"unstable", q.is_unstable},
    };
}

void to_json(nlohmann::json& j, const UploadParameters& p) {
    j = nlohmann::json{
        {"chunk_size", p.chunk_size},
        {"concurrency", p.concurrency},
        {"retry_count", p.retry_count},
        {"retry_delay_ms", p.retry_delay_ms},
        {"timeout_ms", p.timeout_ms},
        {"precheck", p.precheck_enabled},
        {"use_worker", p.use_worker},
    };
}

void to_json(nlohmann::json& j, const EndpointCandidate& c) {
    j = nlohmann::json{
        {"id", c.id},
        {"url", c.url},
        {"latency_ms", c.latency_ms},
        {"weight", c.weight},
        {"availability", c.availability},
        {"region", c.region},
        {"enabled", c.enabled},
    };
}

void to_json(nlohmann::json& j, const ConcurrencyStats& s) {
    j = nlohmann::json{
        {"current", s.current_concurrency},
        {"recommended", s.recommended_concurrency},
        {"active_requests", s.active_requests},
        {"max_achieved_throughput", s.max_achieved_throughput},
        {"average_latency_ms", s.average_latency_ms},
        {"failure_rate", s.failure_rate},
        {"adaptation_count", s.adaptation_count},
        {"stability_score", s.stability_score},
        {"unchanged_rounds", s.consecutive_unchanged_rounds},
        {"mode", std::string(to_string(s.mode))},
        {"tier", std::string(to_string(s.last_tier))},
    };
}

void to_json(nlohmann::json& j, const ConcurrencyChange& c) {
    j = nlohmann::json{
        {"previous", c.previous},
        {"current", c.current},
        {"reason", std::string(to_string(c.reason))},
        {"tier", std::string(to_string(c.tier))},
    };
}

} // namespace uplink::core
