// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>

namespace uplink::core {

// Dispatches chunks and enforces the concurrency limit; owned by the uploader
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    [[nodiscard]] virtual std::uint32_t concurrency() const = 0;
    virtual void set_concurrency(std::uint32_t n) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    [[nodiscard]] virtual bool is_paused() const = 0;
};

} // namespace uplink::core
