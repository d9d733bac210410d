// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace uplink::core {

// Telemetry windows
constexpr std::size_t TRANSFER_SAMPLE_WINDOW = 15;
constexpr std::size_t RTT_SAMPLE_WINDOW = 10;
constexpr std::chrono::milliseconds THROUGHPUT_WINDOW{5000};
constexpr std::uint32_t STABILITY_THRESHOLD = 3;              // Consecutive stable readings
constexpr double STABILITY_CV_THRESHOLD = 0.3;                // Coefficient of variation
constexpr double EMA_ALPHA = 0.3;
constexpr double PACKET_LOSS_CORRECTION = 0.7;                // Retries mask part of the loss
constexpr std::size_t MAX_INFLIGHT_CHUNKS = 256;

// Extreme network conditions
constexpr double EXTREME_PACKET_LOSS = 0.15;
constexpr double EXTREME_RTT_VARIATION_MS = 200.0;
constexpr double EXTREME_AVERAGE_RTT_MS = 1000.0;
constexpr double EXTREME_MIN_THROUGHPUT_BPS = 20.0 * 1024.0;  // 20 KB/s
constexpr double EXTREME_JITTER_MS = 100.0;

// Concurrency control
constexpr std::uint32_t MIN_CONCURRENCY = 1;
constexpr std::uint32_t MAX_CONCURRENCY = 8;
constexpr std::uint32_t BASE_CONCURRENCY = 3;
constexpr std::uint32_t CONCURRENCY_CEILING = 64;
constexpr std::chrono::milliseconds ADAPTATION_INTERVAL{5000};
constexpr std::uint32_t RAMP_UP_STEP = 1;
constexpr std::uint32_t RAMP_DOWN_STEP = 2;                   // Fast backoff, slow growth

// Upload parameters
constexpr std::uint64_t MIN_CHUNK_SIZE = 128 * 1024;          // 128 KB
constexpr std::uint64_t MAX_CHUNK_SIZE = 4 * 1024 * 1024;     // 4 MB
constexpr std::uint32_t MIN_RETRY_DELAY_MS = 200;
constexpr std::uint32_t MIN_TIMEOUT_MS = 5000;
constexpr std::size_t HISTORY_SIZE = 20;

// Endpoint selection
constexpr std::chrono::milliseconds PROBE_TIMEOUT{5000};
constexpr double DISABLE_AVAILABILITY = 0.2;
constexpr std::uint32_t DISABLE_MIN_SAMPLES = 5;
constexpr std::size_t MAX_CANDIDATES = 10;
constexpr std::uint64_t LARGE_PAYLOAD_SIZE = 10 * 1024 * 1024; // 10 MB

constexpr std::uint32_t MAX_REDIRECTS = 10;

} // namespace uplink::core
