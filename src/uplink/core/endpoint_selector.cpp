// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/endpoint_selector.hpp>
#include <uplink/core/log.hpp>
#include <uplink/core/url.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <iterator>
#include <thread>

namespace uplink::core {

namespace {

constexpr std::size_t LOW_TIER_SHORTLIST = 3;
constexpr double HIGH_AVAILABILITY = 0.8;

std::string lowercase(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

double clamp01(double value) noexcept {
    return std::isfinite(value) ? std::clamp(value, 0.0, 1.0) : 0.0;
}

// First candidate with the highest score
template <typename Score>
EndpointCandidate best_by(const std::vector<EndpointCandidate>& pool, Score score) {
    auto best = std::max_element(pool.begin(), pool.end(),
        [&](const EndpointCandidate& a, const EndpointCandidate& b) { return score(a) < score(b); });
    return *best;
}

} // namespace

SelectorConfig SelectorConfig::sanitized() const {
    SelectorConfig c = *this;
    if (c.probe_timeout.count() <= 0) c.probe_timeout = PROBE_TIMEOUT;
    c.disable_availability = clamp01(c.disable_availability);
    c.disable_min_samples = std::max<std::uint32_t>(c.disable_min_samples, 1);
    c.max_candidates = std::max<std::size_t>(c.max_candidates, 1);
    c.local_region = lowercase(c.local_region);
    return c;
}

EndpointSelector::EndpointSelector(SelectorConfig config, std::shared_ptr<EndpointProber> prober)
    : config_(config.sanitized())
    , prober_(prober ? std::move(prober) : std::make_shared<CurlProber>())
    , state_(std::make_shared<State>()) {}

EndpointSelector::~EndpointSelector() {
    dispose();
}

double EndpointSelector::latency_score(double latency_ms) noexcept {
    if (!(latency_ms > 0.0)) return 0.5;  // Unmeasured
    return clamp01(1000.0 / (latency_ms + 100.0));
}

//=============================================================================
// Pool management
//=============================================================================

std::expected<void, std::error_code> EndpointSelector::add_candidate(EndpointCandidate candidate) {
    if (candidate.id.empty()) {
        return std::unexpected(make_error_code(UplinkErrc::invalid_config));
    }
    auto url = Url::parse(candidate.url);
    if (!url) {
        return std::unexpected(url.error());
    }

    candidate.weight = clamp01(candidate.weight);
    candidate.availability = clamp01(candidate.availability);
    candidate.latency_ms = std::max(0.0, candidate.latency_ms);

    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& entries = state_->entries;

    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const Entry& e) { return e.candidate.id == candidate.id; });
    if (it != entries.end()) {
        it->candidate.url = std::move(candidate.url);
        it->candidate.region = std::move(candidate.region);
        return {};
    }

    entries.push_back(Entry{std::move(candidate), {}});

    // Over capacity: drop the weakest of the older candidates
    while (entries.size() > config_.max_candidates) {
        auto weakest = std::min_element(entries.begin(), entries.end() - 1,
            [](const Entry& a, const Entry& b) { return a.candidate.weight < b.candidate.weight; });
        log::get("selector")->debug("pruning candidate {} (weight {:.2f})",
                                    weakest->candidate.id, weakest->candidate.weight);
        entries.erase(weakest);
    }
    return {};
}

bool EndpointSelector::remove_candidate(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return std::erase_if(state_->entries, [&](const Entry& e) { return e.candidate.id == id; }) > 0;
}

bool EndpointSelector::enable(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto& e : state_->entries) {
        if (e.candidate.id == id) {
            e.candidate.enabled = true;
            e.tally = CandidateTally{};
            e.candidate.availability = 1.0;
            return true;
        }
    }
    return false;
}

bool EndpointSelector::disable(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto& e : state_->entries) {
        if (e.candidate.id == id) {
            e.candidate.enabled = false;
            return true;
        }
    }
    return false;
}

//=============================================================================
// Health tracking
//=============================================================================

void EndpointSelector::rescore(Entry& entry) noexcept {
    auto& c = entry.candidate;
    const auto& t = entry.tally;

    auto total = t.successes + t.failures;
    if (total > 0) {
        c.availability = static_cast<double>(t.successes) / static_cast<double>(total);
    }
    if (t.sample_count > 0) {
        c.latency_ms = t.total_latency_ms / static_cast<double>(t.sample_count);
    }
    c.weight = clamp01(c.availability * 0.6 + latency_score(c.latency_ms) * 0.4);
}

void EndpointSelector::record(State& state, const SelectorConfig& config, const std::string& id,
                              bool success, std::optional<double> latency_ms) {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.disposed) {
        return;
    }

    auto it = std::find_if(state.entries.begin(), state.entries.end(),
        [&](const Entry& e) { return e.candidate.id == id; });
    if (it == state.entries.end()) {
        return;
    }

    if (success) {
        ++it->tally.successes;
        if (latency_ms && std::isfinite(*latency_ms) && *latency_ms >= 0.0) {
            it->tally.total_latency_ms += *latency_ms;
            ++it->tally.sample_count;
        }
    } else {
        ++it->tally.failures;
    }
    rescore(*it);

    auto total = it->tally.successes + it->tally.failures;
    if (it->candidate.enabled
        && total >= config.disable_min_samples
        && it->candidate.availability < config.disable_availability) {
        it->candidate.enabled = false;
        log::get("selector")->warn("disabling {}: availability {:.2f} after {} samples",
                                   id, it->candidate.availability, total);
    }
}

void EndpointSelector::record_outcome(const std::string& id, bool success, std::optional<double> latency_ms) {
    record(*state_, config_, id, success, latency_ms);
}

void EndpointSelector::probe_into(const std::shared_ptr<State>& state, const SelectorConfig& config,
                                  const std::shared_ptr<EndpointProber>& prober,
                                  const std::string& id, const std::string& url) {
    auto result = prober->probe(url, config.probe_timeout);
    if (result) {
        record(*state, config, id, true, *result);
    } else {
        log::get("selector")->debug("probe of {} failed: {}", id, result.error().message());
        record(*state, config, id, false, std::nullopt);
    }
}

//=============================================================================
// Probing
//=============================================================================

std::vector<std::pair<std::string, std::string>> EndpointSelector::probe_targets() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<std::pair<std::string, std::string>> targets;
    if (state_->disposed) {
        return targets;
    }
    for (const auto& e : state_->entries) {
        if (e.candidate.enabled) {
            targets.emplace_back(e.candidate.id, e.candidate.url);
        }
    }
    return targets;
}

std::vector<EndpointCandidate> EndpointSelector::enabled_by_weight(State& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    std::vector<EndpointCandidate> out;
    for (const auto& e : state.entries) {
        if (e.candidate.enabled) {
            out.push_back(e.candidate);
        }
    }
    std::stable_sort(out.begin(), out.end(),
        [](const auto& a, const auto& b) { return a.weight > b.weight; });
    return out;
}

std::vector<EndpointCandidate> EndpointSelector::available_candidates() {
    auto targets = probe_targets();
    {
        std::vector<std::jthread> probes;
        probes.reserve(targets.size());
        for (auto& [id, url] : targets) {
            probes.emplace_back([this, id = id, url = url] {
                probe_into(state_, config_, prober_, id, url);
            });
        }
    }
    return enabled_by_weight(*state_);
}

void EndpointSelector::refresh_async(RefreshCallback callback) {
    auto targets = probe_targets();
    if (targets.empty()) {
        if (callback && !disposed()) {
            callback(enabled_by_weight(*state_));
        }
        return;
    }

    auto remaining = std::make_shared<std::atomic<std::size_t>>(targets.size());
    auto shared_callback = std::make_shared<RefreshCallback>(std::move(callback));

    for (auto& [id, url] : targets) {
        std::thread([state = state_, config = config_, prober = prober_,
                     remaining, shared_callback, id = id, url = url] {
            probe_into(state, config, prober, id, url);
            if (remaining->fetch_sub(1, std::memory_order_acq_rel) != 1) {
                return;
            }
            bool gone = false;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                gone = state->disposed;
            }
            if (!gone && *shared_callback) {
                (*shared_callback)(enabled_by_weight(*state));
            }
        }).detach();
    }
}

//=============================================================================
// Selection
//=============================================================================

EndpointSelector::Selection EndpointSelector::select_optimal(const QualityAssessment& quality,
                                                             const std::vector<EndpointCandidate>& candidates,
                                                             std::uint64_t payload_size) const {
    std::vector<EndpointCandidate> pool;
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(pool),
                 [](const auto& c) { return c.enabled; });

    if (pool.empty()) {
        return std::unexpected(make_error_code(UplinkErrc::no_available_endpoint));
    }
    if (pool.size() == 1) {
        return pool.front();
    }

    switch (quality.tier) {
        case NetworkQualityTier::offline:
        case NetworkQualityTier::very_poor:
        case NetworkQualityTier::poor:
        case NetworkQualityTier::low: {
            // Constrained link: responsiveness first
            std::stable_sort(pool.begin(), pool.end(),
                [](const auto& a, const auto& b) { return a.latency_ms < b.latency_ms; });
            pool.resize(std::min(pool.size(), LOW_TIER_SHORTLIST));
            return best_by(pool, [](const auto& c) { return c.availability; });
        }

        case NetworkQualityTier::moderate: {
            double wl = config_.profile == SelectorProfile::cdn ? 0.5 : 0.4;
            double ww = config_.profile == SelectorProfile::cdn ? 0.2 : 0.3;
            return best_by(pool, [&](const auto& c) {
                return latency_score(c.latency_ms) * wl + c.weight * ww + c.availability * 0.3;
            });
        }

        case NetworkQualityTier::good:
        case NetworkQualityTier::excellent:
            break;
    }

    std::vector<EndpointCandidate> reliable;
    std::copy_if(pool.begin(), pool.end(), std::back_inserter(reliable),
                 [](const auto& c) { return c.availability > HIGH_AVAILABILITY; });
    if (!reliable.empty()) {
        pool = std::move(reliable);
    }

    if (payload_size > config_.large_payload && !config_.local_region.empty()) {
        std::vector<EndpointCandidate> local;
        std::copy_if(pool.begin(), pool.end(), std::back_inserter(local),
                     [&](const auto& c) { return lowercase(c.region) == config_.local_region; });
        if (!local.empty()) {
            pool = std::move(local);
        }
    }

    return best_by(pool, [](const auto& c) { return c.weight; });
}

EndpointSelector::Selection EndpointSelector::select(const QualityAssessment& quality,
                                                     std::uint64_t payload_size) const {
    return select_optimal(quality, enabled_by_weight(*state_), payload_size);
}

std::vector<EndpointCandidate> EndpointSelector::candidates() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<EndpointCandidate> out;
    out.reserve(state_->entries.size());
    for (const auto& e : state_->entries) {
        out.push_back(e.candidate);
    }
    std::stable_sort(out.begin(), out.end(),
        [](const auto& a, const auto& b) { return a.weight > b.weight; });
    return out;
}

std::optional<CandidateTally> EndpointSelector::tally(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (const auto& e : state_->entries) {
        if (e.candidate.id == id) {
            return e.tally;
        }
    }
    return std::nullopt;
}

void EndpointSelector::dispose() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->disposed = true;
}

bool EndpointSelector::disposed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->disposed;
}

} // namespace uplink::core
