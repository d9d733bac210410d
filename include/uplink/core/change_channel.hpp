// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace uplink::core {

// Fan-out queue: every subscriber receives published events in order.
// Publishing never runs subscriber code; subscribers poll or wait.
// Each queue holds at most `capacity` events. On overflow the oldest are
// discarded and counted in Subscription::dropped().
template <typename T>
class ChangeChannel {
    struct Queue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> items;
        std::uint64_t dropped{0};
    };

public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    class Subscription {
    public:
        Subscription() = default;

        [[nodiscard]] std::optional<T> try_poll() {
            if (!queue_) return std::nullopt;
            std::lock_guard<std::mutex> lock(queue_->mutex);
            if (queue_->items.empty()) return std::nullopt;
            T item = std::move(queue_->items.front());
            queue_->items.pop_front();
            return item;
        }

        template <typename Rep, typename Period>
        [[nodiscard]] std::optional<T> wait_for(std::chrono::duration<Rep, Period> timeout) {
            if (!queue_) return std::nullopt;
            std::unique_lock<std::mutex> lock(queue_->mutex);
            if (!queue_->cv.wait_for(lock, timeout, [this] { return !queue_->items.empty(); })) {
                return std::nullopt;
            }
            T item = std::move(queue_->items.front());
            queue_->items.pop_front();
            return item;
        }

        [[nodiscard]] std::vector<T> drain() {
            std::vector<T> out;
            if (!queue_) return out;
            std::lock_guard<std::mutex> lock(queue_->mutex);
            out.assign(std::make_move_iterator(queue_->items.begin()),
                       std::make_move_iterator(queue_->items.end()));
            queue_->items.clear();
            return out;
        }

        [[nodiscard]] std::size_t pending() const {
            if (!queue_) return 0;
            std::lock_guard<std::mutex> lock(queue_->mutex);
            return queue_->items.size();
        }

        // Events lost to overflow since subscribing
        [[nodiscard]] std::uint64_t dropped() const {
            if (!queue_) return 0;
            std::lock_guard<std::mutex> lock(queue_->mutex);
            return queue_->dropped;
        }

        [[nodiscard]] bool valid() const noexcept { return queue_ != nullptr; }

    private:
        friend class ChangeChannel;
        explicit Subscription(std::shared_ptr<Queue> queue) : queue_(std::move(queue)) {}

        std::shared_ptr<Queue> queue_;
    };

    explicit ChangeChannel(std::size_t capacity = DEFAULT_CAPACITY)
        : capacity_(std::max<std::size_t>(capacity, 1)) {}

    ChangeChannel(const ChangeChannel&) = delete;
    ChangeChannel& operator=(const ChangeChannel&) = delete;

    // Dropping the returned subscription unsubscribes
    [[nodiscard]] Subscription subscribe() {
        auto queue = std::make_shared<Queue>();
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(queue);
        return Subscription(std::move(queue));
    }

    void publish(const T& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(subscribers_, [](const auto& w) { return w.expired(); });

        for (auto& weak : subscribers_) {
            auto queue = weak.lock();
            if (!queue) continue;
            {
                std::lock_guard<std::mutex> qlock(queue->mutex);
                queue->items.push_back(event);
                // Slow readers lose the oldest events first
                while (queue->items.size() > capacity_) {
                    queue->items.pop_front();
                    ++queue->dropped;
                }
            }
            queue->cv.notify_one();
        }
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
            [](const auto& w) { return !w.expired(); }));
    }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Queue>> subscribers_;
};

} // namespace uplink::core
