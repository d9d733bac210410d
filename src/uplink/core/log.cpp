// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <mutex>

namespace uplink::core::log {

namespace {

std::mutex& registry_mutex() {
    static std::mutex m;
    return m;
}

std::atomic<spdlog::level::level_enum>& current_level() {
    static std::atomic<spdlog::level::level_enum> level{spdlog::level::info};
    return level;
}

} // namespace

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(current_level().load(std::memory_order_relaxed));
    return logger;
}

void set_level(spdlog::level::level_enum level) noexcept {
    current_level().store(level, std::memory_order_relaxed);
    spdlog::set_level(level);
}

} // namespace uplink::core::log
