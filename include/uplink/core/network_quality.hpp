// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace uplink::core {

using Clock = std::chrono::steady_clock;

// Ordered network quality scale, worst first
enum class NetworkQualityTier : std::uint8_t {
    offline,
    very_poor,
    poor,
    low,
    moderate,
    good,
    excellent
};

constexpr std::size_t TIER_COUNT = 7;

[[nodiscard]] constexpr int tier_level(NetworkQualityTier tier) noexcept {
    return static_cast<int>(tier);
}

// Signed level difference, positive when `to` is better than `from`
[[nodiscard]] constexpr int tier_distance(NetworkQualityTier from, NetworkQualityTier to) noexcept {
    return tier_level(to) - tier_level(from);
}

[[nodiscard]] constexpr std::string_view to_string(NetworkQualityTier tier) noexcept {
    switch (tier) {
        case NetworkQualityTier::offline: return "offline";
        case NetworkQualityTier::very_poor: return "very_poor";
        case NetworkQualityTier::poor: return "poor";
        case NetworkQualityTier::low: return "low";
        case NetworkQualityTier::moderate: return "moderate";
        case NetworkQualityTier::good: return "good";
        case NetworkQualityTier::excellent: return "excellent";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<NetworkQualityTier> tier_from_string(std::string_view name) noexcept {
    for (std::size_t i = 0; i < TIER_COUNT; ++i) {
        auto tier = static_cast<NetworkQualityTier>(i);
        if (to_string(tier) == name) return tier;
    }
    return std::nullopt;
}

// One quality judgement handed to the adjuster and the selector
struct QualityAssessment {
    NetworkQualityTier tier{NetworkQualityTier::moderate};
    double score{0.0};                 // 0-100
    double throughput_bps{0.0};
    double latency_ms{0.0};
    double packet_loss{0.0};           // [0, 1]
    double jitter_ms{0.0};
    bool is_unstable{false};
    Clock::time_point timestamp{};
};

} // namespace uplink::core
