// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/config.hpp>
#include <uplink/core/endpoint_prober.hpp>
#include <uplink/core/error.hpp>
#include <uplink/core/network_quality.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uplink::core {

// Scoring blend used on moderate links
enum class SelectorProfile : std::uint8_t {
    path,   // Latency 0.4, weight 0.3, availability 0.3
    cdn     // Latency 0.5, weight 0.2, availability 0.3
};

[[nodiscard]] constexpr std::string_view to_string(SelectorProfile profile) noexcept {
    return profile == SelectorProfile::cdn ? "cdn" : "path";
}

// A transport target: an upload path or a CDN node
struct EndpointCandidate {
    std::string id;
    std::string url;
    double latency_ms{0.0};
    double weight{0.5};          // [0, 1]
    double availability{1.0};    // [0, 1]
    std::string region;
    bool enabled{true};
};

// Running outcome counts for one candidate
struct CandidateTally {
    std::uint32_t successes{0};
    std::uint32_t failures{0};
    double total_latency_ms{0.0};
    std::uint32_t sample_count{0};   // Samples carrying a latency
};

struct SelectorConfig {
    std::chrono::milliseconds probe_timeout{PROBE_TIMEOUT};
    double disable_availability{DISABLE_AVAILABILITY};
    std::uint32_t disable_min_samples{DISABLE_MIN_SAMPLES};
    std::size_t max_candidates{MAX_CANDIDATES};
    std::string local_region;
    std::uint64_t large_payload{LARGE_PAYLOAD_SIZE};
    SelectorProfile profile{SelectorProfile::path};

    [[nodiscard]] SelectorConfig sanitized() const;
};

// Probes, scores and picks endpoints. Health tallies survive across calls;
// probe results arriving after dispose() are dropped.
class EndpointSelector {
public:
    using Selection = std::expected<EndpointCandidate, std::error_code>;
    using RefreshCallback = std::function<void(std::vector<EndpointCandidate>)>;

    explicit EndpointSelector(SelectorConfig config = {},
                              std::shared_ptr<EndpointProber> prober = nullptr);
    ~EndpointSelector();

    EndpointSelector(const EndpointSelector&) = delete;
    EndpointSelector& operator=(const EndpointSelector&) = delete;

    // Adds or, for a known id, updates a candidate
    [[nodiscard]] std::expected<void, std::error_code> add_candidate(EndpointCandidate candidate);
    bool remove_candidate(const std::string& id);

    // Re-enabling clears the candidate's tally
    bool enable(const std::string& id);
    bool disable(const std::string& id);

    // Outcome of a real transfer or a probe
    void record_outcome(const std::string& id, bool success, std::optional<double> latency_ms = std::nullopt);

    // Probes every candidate in parallel and waits; enabled candidates by weight, best first
    [[nodiscard]] std::vector<EndpointCandidate> available_candidates();

    // Same probe round without blocking; the callback runs on a probe thread
    void refresh_async(RefreshCallback callback);

    [[nodiscard]] Selection select_optimal(const QualityAssessment& quality,
                                           const std::vector<EndpointCandidate>& candidates,
                                           std::uint64_t payload_size = 0) const;

    // Selection over the current pool without probing
    [[nodiscard]] Selection select(const QualityAssessment& quality, std::uint64_t payload_size = 0) const;

    [[nodiscard]] std::vector<EndpointCandidate> candidates() const;
    [[nodiscard]] std::optional<CandidateTally> tally(const std::string& id) const;
    [[nodiscard]] const SelectorConfig& config() const noexcept { return config_; }

    void dispose();
    [[nodiscard]] bool disposed() const;

    [[nodiscard]] static double latency_score(double latency_ms) noexcept;

private:
    struct Entry {
        EndpointCandidate candidate;
        CandidateTally tally;
    };

    struct State {
        std::mutex mutex;
        std::vector<Entry> entries;
        bool disposed{false};
    };

    static void record(State& state, const SelectorConfig& config, const std::string& id,
                       bool success, std::optional<double> latency_ms);
    static void rescore(Entry& entry) noexcept;
    static std::vector<EndpointCandidate> enabled_by_weight(State& state);
    static void probe_into(const std::shared_ptr<State>& state, const SelectorConfig& config,
                           const std::shared_ptr<EndpointProber>& prober,
                           const std::string& id, const std::string& url);

    [[nodiscard]] std::vector<std::pair<std::string, std::string>> probe_targets() const;

    SelectorConfig config_;
    std::shared_ptr<EndpointProber> prober_;
    std::shared_ptr<State> state_;
};

} // namespace uplink::core
