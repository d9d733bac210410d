// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/config.hpp>
#include <uplink/core/network_quality.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace uplink::core {

struct UploadParameters {
    std::uint64_t chunk_size{512 * 1024};
    std::uint32_t concurrency{3};
    std::uint32_t retry_count{3};
    std::uint32_t retry_delay_ms{1000};
    std::uint32_t timeout_ms{30000};
    bool precheck_enabled{true};
    bool use_worker{true};

    bool operator==(const UploadParameters&) const = default;
};

struct HistoricalOutcome {
    NetworkQualityTier tier{NetworkQualityTier::moderate};
    UploadParameters parameters;
    bool success{false};
    std::optional<double> transfer_rate;  // bytes/s
};

// Built-in parameter table for a tier
[[nodiscard]] UploadParameters default_preset(NetworkQualityTier tier) noexcept;

struct AdjusterConfig {
    std::uint64_t min_chunk_size{MIN_CHUNK_SIZE};
    std::uint64_t max_chunk_size{MAX_CHUNK_SIZE};
    std::uint32_t min_concurrency{1};
    std::uint32_t max_concurrency{6};
    bool adaptive_learning{true};
    std::size_t history_size{HISTORY_SIZE};
    std::size_t learning_min_samples{5};
    double learning_gain{1.2};            // Best rate must beat the average by this factor
    std::array<std::optional<UploadParameters>, TIER_COUNT> preset_overrides{};

    [[nodiscard]] AdjusterConfig sanitized() const noexcept;
};

// Maps quality assessments onto upload parameters, refined by past outcomes
class ParameterAdjuster {
public:
    explicit ParameterAdjuster(AdjusterConfig config = {});

    [[nodiscard]] UploadParameters recommended_parameters(const QualityAssessment& quality) const;

    // Conservative when the link is unstable, otherwise a rate-limited move toward the recommendation
    [[nodiscard]] UploadParameters adjust_parameters(const QualityAssessment& quality,
                                                     const UploadParameters& current) const;

    [[nodiscard]] UploadParameters validate_parameters(UploadParameters params) const noexcept;
    [[nodiscard]] UploadParameters minimum_safe_parameters() const noexcept;
    [[nodiscard]] const UploadParameters& preset(NetworkQualityTier tier) const noexcept;

    void record_upload_result(const QualityAssessment& quality, const UploadParameters& parameters,
                              bool success, std::optional<double> transfer_rate = std::nullopt);
    void reset_history();

    [[nodiscard]] std::vector<HistoricalOutcome> history() const;
    [[nodiscard]] const AdjusterConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] UploadParameters learned(UploadParameters base, NetworkQualityTier tier) const;
    [[nodiscard]] UploadParameters conservative(const UploadParameters& recommended,
                                                const UploadParameters& current) const noexcept;
    [[nodiscard]] UploadParameters smooth(const UploadParameters& current,
                                          const UploadParameters& target) const noexcept;

    AdjusterConfig config_;
    std::array<UploadParameters, TIER_COUNT> presets_;

    mutable std::mutex mutex_;
    std::deque<HistoricalOutcome> history_;
};

} // namespace uplink::core
