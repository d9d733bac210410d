// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/cli/commands.hpp>
#include <uplink/core/endpoint_prober.hpp>
#include <uplink/core/endpoint_selector.hpp>
#include <uplink/core/log.hpp>
#include <uplink/core/session_config.hpp>
#include <uplink/version.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <ostream>

using namespace uplink::core;

namespace chrono = std::chrono;

namespace uplink::cli {

namespace {

std::expected<SessionConfig, std::error_code> load_config(const std::string& path) {
    if (path.empty()) {
        return SessionConfig{};
    }
    auto config = SessionConfig::load(path);
    if (!config) {
        std::cerr << "Error: " << path << ": " << config.error().message() << std::endl;
    }
    return config;
}

std::string kib(double bytes) {
    return std::format("{:.1f}KB", bytes / 1024.0);
}

void print_tick(std::ostream& out, std::int64_t t_ms, const SessionTick& tick, bool json_output) {
    if (json_output) {
        nlohmann::json j;
        j["t"] = t_ms;
        j["assessment"] = tick.assessment;
        j["stats"] = tick.stats;
        j["extreme"] = tick.extreme_conditions;
        j["parameters"] = tick.parameters;
        j["concurrency"] = tick.effective_concurrency;
        if (tick.change) {
            j["change"] = *tick.change;
        }
        out << j.dump() << '\n';
        return;
    }

    out << std::format("t={}ms tier={} score={:.0f} thr={}/s rtt={:.0f}ms conc={} chunk={} retries={} timeout={}ms",
                       t_ms, to_string(tick.assessment.tier), tick.assessment.score,
                       kib(tick.stats.current_throughput), tick.stats.average_rtt_ms,
                       tick.effective_concurrency, kib(static_cast<double>(tick.parameters.chunk_size)),
                       tick.parameters.retry_count, tick.parameters.timeout_ms);
    if (tick.assessment.is_unstable) {
        out << " [unstable]";
    }
    if (tick.change) {
        out << std::format(" change {}->{} ({})", tick.change->previous, tick.change->current,
                           to_string(tick.change->reason));
    }
    out << '\n';
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "--json") {
            args.json = true;
            continue;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            }
            continue;
        }
        if (arg == "-r" || arg == "--region") {
            if (i + 1 < argc) {
                args.region = argv[++i];
            }
            continue;
        }
        if (arg == "-t" || arg == "--tier") {
            if (i + 1 < argc) {
                args.tier = argv[++i];
            }
            continue;
        }
        if (arg == "-s" || arg == "--size") {
            if (i + 1 < argc) {
                char* end = nullptr;
                args.payload_size = std::strtoull(argv[++i], &end, 10);
                if (end == nullptr || *end != '\0') {
                    args.payload_size = 0;
                }
            }
            continue;
        }

        if (args.command == Command::none) {
            if (arg == "probe") {
                args.command = Command::probe;
            } else if (arg == "replay") {
                args.command = Command::replay;
            }
            continue;
        }

        if (args.command == Command::probe && (arg.starts_with("http://") || arg.starts_with("https://"))) {
            args.urls.push_back(arg);
        } else if (args.command == Command::replay && args.trace_path.empty()) {
            args.trace_path = arg;
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult probe(const CliArgs& args) noexcept {
    try {
        auto config = load_config(args.config_path);
        if (!config) {
            return std::unexpected(config.error());
        }

        auto tier = tier_from_string(args.tier);
        if (!tier) {
            std::cerr << "Error: unknown tier '" << args.tier << "'" << std::endl;
            return std::unexpected(make_error_code(UplinkErrc::invalid_config));
        }

        if (!args.region.empty()) {
            config->selector.local_region = args.region;
        }

        CurlGlobal curl;
        if (!curl.ok()) {
            std::cerr << "Error: libcurl initialization failed" << std::endl;
            return std::unexpected(make_error_code(UplinkErrc::network_error));
        }

        int exit_code = 0;
        {
            EndpointSelector selector(config->selector, std::make_shared<CurlProber>());

            for (const auto& endpoint : config->endpoints) {
                if (auto added = selector.add_candidate(endpoint); !added) {
                    std::cerr << "Skipping " << endpoint.url << ": " << added.error().message() << std::endl;
                }
            }
            for (const auto& url : args.urls) {
                EndpointCandidate candidate;
                candidate.id = url;
                candidate.url = url;
                if (auto added = selector.add_candidate(candidate); !added) {
                    std::cerr << "Skipping " << url << ": " << added.error().message() << std::endl;
                }
            }

            auto available = selector.available_candidates();
            if (args.json) {
                nlohmann::json j;
                j["candidates"] = available;
                QualityAssessment quality;
                quality.tier = *tier;
                auto chosen = selector.select_optimal(quality, available, args.payload_size);
                j["selected"] = chosen ? nlohmann::json(*chosen) : nlohmann::json(nullptr);
                std::cout << j.dump(2) << std::endl;
                exit_code = chosen ? 0 : 1;
            } else {
                for (const auto& c : available) {
                    std::cout << std::format("{:<24} weight={:.2f} availability={:.2f} latency={:.0f}ms {}\n",
                                             c.id, c.weight, c.availability, c.latency_ms, c.region);
                }

                QualityAssessment quality;
                quality.tier = *tier;
                auto chosen = selector.select_optimal(quality, available, args.payload_size);
                if (chosen) {
                    std::cout << "Selected for " << to_string(*tier) << ": " << chosen->url << std::endl;
                } else {
                    std::cout << "Error: " << chosen.error().message() << std::endl;
                    exit_code = 1;
                }
            }
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(UplinkErrc::network_error));
    }
}

std::expected<ReplaySummary, std::error_code>
replay_trace(std::istream& in, AdaptiveSession& session, std::ostream& out,
             bool json_output, Clock::time_point origin) {
    ReplaySummary summary;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        nlohmann::json event;
        try {
            event = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            core::log::get("session")->error("trace line {}: {}", line_no, e.what());
            return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
        }

        try {
            auto t_ms = event.value("t", std::int64_t{0});
            auto now = origin + chrono::milliseconds(t_ms);
            auto kind = event.at("event").get<std::string>();
            auto endpoint = event.value("endpoint", std::string{});

            if (kind == "chunk") {
                auto bytes = event.at("bytes").get<std::uint64_t>();
                auto duration = event.at("duration_ms").get<double>();
                std::optional<double> rtt;
                if (event.contains("rtt_ms")) {
                    rtt = event["rtt_ms"].get<double>();
                }
                session.on_chunk_uploaded(bytes, duration, rtt, endpoint, now);
            } else if (kind == "error") {
                std::optional<std::uint64_t> bytes;
                if (event.contains("bytes")) {
                    bytes = event["bytes"].get<std::uint64_t>();
                }
                session.on_chunk_error(bytes, event.value("retry", 0u), endpoint, now);
            } else if (kind == "online") {
                session.on_connectivity_change(event.at("online").get<bool>(), now);
            } else if (kind == "tick") {
                auto tick = session.tick(now);
                ++summary.ticks;
                if (tick.change) {
                    ++summary.changes;
                }
                print_tick(out, t_ms, tick, json_output);
            } else {
                core::log::get("session")->error("trace line {}: unknown event '{}'", line_no, kind);
                return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
            }
        } catch (const nlohmann::json::exception& e) {
            core::log::get("session")->error("trace line {}: {}", line_no, e.what());
            return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
        }
        ++summary.events;
    }

    summary.final_concurrency = session.effective_concurrency();
    summary.final_tier = session.assessment().tier;
    return summary;
}

CliResult replay(const CliArgs& args) noexcept {
    try {
        if (args.trace_path.empty()) {
            std::cerr << "Error: No trace file specified" << std::endl;
            return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
        }

        auto config = load_config(args.config_path);
        if (!config) {
            return std::unexpected(config.error());
        }

        std::ifstream in(args.trace_path);
        if (!in) {
            std::cerr << "Error: cannot open " << args.trace_path << std::endl;
            return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
        }

        // Simulated clock: the trace's own timestamps drive every component
        Clock::time_point origin{};
        AdaptiveSession session(*config, nullptr, nullptr, origin);

        auto summary = replay_trace(in, session, std::cout, args.json, origin);
        if (!summary) {
            std::cerr << "Error: " << args.trace_path << ": " << summary.error().message() << std::endl;
            return std::unexpected(summary.error());
        }

        if (args.json) {
            std::cout << session.report().dump(2) << std::endl;
        } else if (!args.quiet) {
            std::cout << std::format("{} events, {} ticks, {} concurrency changes, final tier {} at concurrency {}\n",
                                     summary->events, summary->ticks, summary->changes,
                                     to_string(summary->final_tier), summary->final_concurrency);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(UplinkErrc::invalid_trace));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Uplink " << program_name << " - Adaptive transport control for chunked uploads\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " probe [OPTIONS] <URL>...\n";
    std::cout << "  " << program_name << " replay [OPTIONS] <TRACE>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log warnings and errors\n";
    std::cout << "  -c, --config <FILE>     Load session configuration (JSON)\n";
    std::cout << "  -r, --region <NAME>     Local region for endpoint selection\n";
    std::cout << "  -s, --size <BYTES>      Payload size used for endpoint selection\n";
    std::cout << "  -t, --tier <TIER>       Quality tier for endpoint selection (default: good)\n";
    std::cout << "      --json              Machine-readable output\n";
    std::cout << "\n";
    std::cout << "TRACE FORMAT (one JSON object per line):\n";
    std::cout << "  {\"t\":0,\"event\":\"chunk\",\"bytes\":524288,\"duration_ms\":900,\"rtt_ms\":120}\n";
    std::cout << "  {\"t\":400,\"event\":\"error\",\"retry\":1}\n";
    std::cout << "  {\"t\":5000,\"event\":\"tick\"}\n";
    std::cout << "  {\"t\":6000,\"event\":\"online\",\"online\":false}\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " probe -t moderate https://a.example.com https://b.example.com\n";
    std::cout << "  " << program_name << " replay -c session.json upload.trace\n";
}

void print_version() noexcept {
    std::cout << "Uplink " << uplink::version.to_string() << std::endl;
    std::cout << "Built " << uplink::BUILD_DATE << " " << uplink::BUILD_TIME << "\n";
    std::cout << "Built with C++23, libcurl, spdlog, nlohmann_json\n";
}

} // namespace uplink::cli
