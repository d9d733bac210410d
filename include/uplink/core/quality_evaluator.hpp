// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/network_quality.hpp>
#include <uplink/core/telemetry_analyzer.hpp>

namespace uplink::core {

// Maps telemetry onto the tier scale through a 0-100 score
class QualityEvaluator {
public:
    // Down links are always offline; extreme conditions mark the result unstable
    [[nodiscard]] QualityAssessment evaluate(const PerformanceStats& stats,
                                             bool extreme_conditions,
                                             bool online = true,
                                             Clock::time_point now = Clock::now()) const noexcept;

    [[nodiscard]] QualityAssessment evaluate(const TelemetryAnalyzer& telemetry,
                                             bool online = true,
                                             Clock::time_point now = Clock::now()) const;

    [[nodiscard]] static double score(const PerformanceStats& stats) noexcept;
    [[nodiscard]] static NetworkQualityTier tier_for_score(double score) noexcept;
};

} // namespace uplink::core
