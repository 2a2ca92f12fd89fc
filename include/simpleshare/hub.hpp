/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "simpleshare/event.hpp"
#include "simpleshare/types.hpp"

namespace simpleshare {

class Registry;

// One observer's delivery queue. The hub pushes without blocking, the
// connection thread drains it with next(). A subscriber belongs to at
// most one job at a time.
class Subscriber final {
public:
    explicit Subscriber(std::size_t maxPending = 1024) noexcept : maxPending_(maxPending) {}

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    // False when the subscriber is closed. Overflow closes it.
    [[nodiscard]] bool push(const Event& event);

    // Waits up to timeout. nullopt on timeout or once closed and drained.
    [[nodiscard]] std::optional<Event> next(std::chrono::milliseconds timeout);

    void close() noexcept;
    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] std::size_t pending() const noexcept;

private:
    friend class Hub;

    std::size_t maxPending_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Event> queue_;
    bool closed_ = false;

    JobId owner_;  // guarded by the hub's mutex
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

enum class AttachResult : uint8_t {
    Attached,
    NotFound,
    AlreadyAttached  // subscriber is registered with another job
};

class Hub final {
public:
    explicit Hub(const Registry& registry) noexcept;

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;
    Hub(Hub&&) = delete;
    Hub& operator=(Hub&&) = delete;

    // Queues the current snapshot on the subscriber, then registers it.
    // Attaching again to the same job is a no-op.
    [[nodiscard]] AttachResult attach(const JobId& id, const SubscriberPtr& subscriber);

    // Safe to repeat, and safe after the job has terminated.
    void detach(const JobId& id, const SubscriberPtr& subscriber) noexcept;

    // Returns the number of subscribers that accepted the event.
    std::size_t broadcast(const JobId& id, EventKind kind, const Snapshot& snapshot) noexcept;

    [[nodiscard]] std::size_t subscriberCount(const JobId& id) const noexcept;

    void closeAll() noexcept;

private:
    const Registry& registry_;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, std::vector<SubscriberPtr>> subscribers_;
};

}
