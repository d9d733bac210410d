// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace uplink::core::log {

// Named stderr logger for a component; created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name);

// Set the level for every component logger
void set_level(spdlog::level::level_enum level) noexcept;

} // namespace uplink::core::log
