// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/session_config.hpp>
#include <uplink/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace uplink::core {

namespace {

using nlohmann::json;

template <typename T>
void read(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null()) {
        field = j[key].get<T>();
    }
}

// Negative counts are treated as zero and left to sanitizing
template <typename T>
void read_count(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null()) {
        auto value = j[key].get<std::int64_t>();
        field = value < 0 ? T{0} : static_cast<T>(value);
    }
}

void read_ms(const json& j, const char* key, std::chrono::milliseconds& field) {
    if (j.contains(key) && !j[key].is_null()) {
        field = std::chrono::milliseconds(j[key].get<std::int64_t>());
    }
}

void parse_telemetry(const json& j, TelemetryConfig& c) {
    read_count(j, "max_transfer_samples", c.max_transfer_samples);
    read_count(j, "max_rtt_samples", c.max_rtt_samples);
    read_ms(j, "throughput_window_ms", c.throughput_window);
    read_count(j, "stability_threshold", c.stability_threshold);
    read(j, "stability_cv_threshold", c.stability_cv_threshold);
    read(j, "ema_alpha", c.ema_alpha);
    read(j, "jitter_alpha", c.jitter_alpha);
    read(j, "loss_correction", c.loss_correction);
    read_count(j, "trend_samples", c.trend_samples);
    read(j, "improving_ratio", c.improving_ratio);
    read(j, "degrading_ratio", c.degrading_ratio);

    if (j.contains("extreme") && j["extreme"].is_object()) {
        const auto& e = j["extreme"];
        read(e, "packet_loss", c.extreme_packet_loss);
        read(e, "rtt_variation_ms", c.extreme_rtt_variation_ms);
        read(e, "average_rtt_ms", c.extreme_average_rtt_ms);
        read(e, "min_throughput_bps", c.extreme_min_throughput_bps);
        read(e, "jitter_ms", c.extreme_jitter_ms);
    }
}

void parse_concurrency(const json& j, ConcurrencyConfig& c) {
    read_count(j, "min", c.min_concurrency);
    read_count(j, "max", c.max_concurrency);
    read_count(j, "base", c.base_concurrency);
    read_ms(j, "adaptation_interval_ms", c.adaptation_interval);
    read(j, "aggressiveness", c.aggressiveness);
    read_count(j, "ramp_up_step", c.ramp_up_step);
    read_count(j, "ramp_down_step", c.ramp_down_step);
    read(j, "exploration", c.exploration_enabled);
    read_count(j, "exploration_rounds", c.exploration_rounds);
    read_count(j, "seed", c.seed);
}

void parse_preset(const json& j, UploadParameters& p) {
    read_count(j, "chunk_size", p.chunk_size);
    read_count(j, "concurrency", p.concurrency);
    read_count(j, "retry_count", p.retry_count);
    read_count(j, "retry_delay_ms", p.retry_delay_ms);
    read_count(j, "timeout_ms", p.timeout_ms);
    read(j, "precheck", p.precheck_enabled);
    read(j, "use_worker", p.use_worker);
}

std::expected<void, std::error_code> parse_adjuster(const json& j, AdjusterConfig& c) {
    read_count(j, "min_chunk_size", c.min_chunk_size);
    read_count(j, "max_chunk_size", c.max_chunk_size);
    read_count(j, "min_concurrency", c.min_concurrency);
    read_count(j, "max_concurrency", c.max_concurrency);
    read(j, "adaptive_learning", c.adaptive_learning);
    read_count(j, "history_size", c.history_size);

    if (j.contains("presets") && j["presets"].is_object()) {
        for (const auto& [name, value] : j["presets"].items()) {
            auto tier = tier_from_string(name);
            if (!tier || !value.is_object()) {
                return std::unexpected(make_error_code(UplinkErrc::invalid_config));
            }
            auto preset = default_preset(*tier);
            parse_preset(value, preset);
            c.preset_overrides[static_cast<std::size_t>(*tier)] = preset;
        }
    }
    return {};
}

std::expected<void, std::error_code> parse_selector(const json& j, SelectorConfig& c) {
    read_ms(j, "probe_timeout_ms", c.probe_timeout);
    read(j, "disable_availability", c.disable_availability);
    read_count(j, "disable_min_samples", c.disable_min_samples);
    read_count(j, "max_candidates", c.max_candidates);
    read(j, "local_region", c.local_region);
    read_count(j, "large_payload", c.large_payload);

    if (j.contains("profile")) {
        auto profile = j["profile"].get<std::string>();
        if (profile == "path") {
            c.profile = SelectorProfile::path;
        } else if (profile == "cdn") {
            c.profile = SelectorProfile::cdn;
        } else {
            return std::unexpected(make_error_code(UplinkErrc::invalid_config));
        }
    }
    return {};
}

EndpointCandidate parse_endpoint(const json& j) {
    EndpointCandidate c;
    c.url = j.at("url").get<std::string>();
    c.id = c.url;
    read(j, "id", c.id);
    read(j, "region", c.region);
    read(j, "latency_ms", c.latency_ms);
    read(j, "weight", c.weight);
    read(j, "enabled", c.enabled);
    return c;
}

} // namespace

std::expected<SessionConfig, std::error_code> SessionConfig::parse(std::string_view text) noexcept {
    try {
        auto j = json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            return std::unexpected(make_error_code(UplinkErrc::invalid_config));
        }

        SessionConfig config;
        if (j.contains("telemetry")) parse_telemetry(j["telemetry"], config.telemetry);
        if (j.contains("concurrency")) parse_concurrency(j["concurrency"], config.concurrency);
        if (j.contains("parameters")) {
            if (auto r = parse_adjuster(j["parameters"], config.adjuster); !r) {
                return std::unexpected(r.error());
            }
        }
        if (j.contains("selector")) {
            if (auto r = parse_selector(j["selector"], config.selector); !r) {
                return std::unexpected(r.error());
            }
        }
        if (j.contains("endpoints")) {
            if (!j["endpoints"].is_array()) {
                return std::unexpected(make_error_code(UplinkErrc::invalid_config));
            }
            for (const auto& e : j["endpoints"]) {
                config.endpoints.push_back(parse_endpoint(e));
            }
        }

        return config.sanitized();
    } catch (const std::exception& e) {
        log::get("session")->warn("rejecting configuration: {}", e.what());
        return std::unexpected(make_error_code(UplinkErrc::invalid_config));
    }
}

std::expected<SessionConfig, std::error_code> SessionConfig::load(const std::filesystem::path& path) noexcept {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(make_error_code(UplinkErrc::config_not_found));
    }

    std::string text;
    try {
        std::ostringstream buffer;
        buffer << in.rdbuf();
        text = buffer.str();
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(UplinkErrc::invalid_config));
    }
    return parse(text);
}

SessionConfig SessionConfig::sanitized() const {
    SessionConfig c = *this;
    c.telemetry = c.telemetry.sanitized();
    c.concurrency = c.concurrency.sanitized();
    c.adjuster = c.adjuster.sanitized();
    c.selector = c.selector.sanitized();
    return c;
}

} // namespace uplink::core
