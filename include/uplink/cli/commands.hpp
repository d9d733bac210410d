// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplink/core/adaptive_session.hpp>
#include <uplink/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace uplink::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command { none, probe, replay };

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> urls;
    std::string config_path;
    std::string region;
    std::string tier{"good"};
    std::string trace_path;
    std::uint64_t payload_size{0};
    bool json{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

struct ReplaySummary {
    std::size_t events{0};
    std::size_t ticks{0};
    std::size_t changes{0};
    std::uint32_t final_concurrency{0};
    core::NetworkQualityTier final_tier{core::NetworkQualityTier::moderate};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Probe candidate endpoints and print the one chosen for the tier
[[nodiscard]] CliResult probe(const CliArgs& args) noexcept;

// Replay a recorded event trace through a session
[[nodiscard]] CliResult replay(const CliArgs& args) noexcept;

// One JSON object per line: {"t": ms, "event": "chunk" | "error" | "tick" | "online", ...}.
// Timestamps are relative to `origin`; blank lines and '#' comments are skipped.
[[nodiscard]] std::expected<ReplaySummary, std::error_code>
replay_trace(std::istream& in, core::AdaptiveSession& session, std::ostream& out,
             bool json_output, core::Clock::time_point origin);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace uplink::cli
