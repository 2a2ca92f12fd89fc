/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/hub.hpp"
#include "simpleshare/registry.hpp"
#include "simpleshare/logger.hpp"
#include <algorithm>

namespace simpleshare {

bool Subscriber::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= maxPending_) {
            // Reader fell too far behind; dropping events would break ordering
            closed_ = true;
            queue_.clear();
            available_.notify_all();
            return false;
        }
        queue_.push_back(event);
    }
    available_.notify_one();
    return true;
}

std::optional<Event> Subscriber::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void Subscriber::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool Subscriber::closed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t Subscriber::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

Hub::Hub(const Registry& registry) noexcept : registry_(registry) {}

AttachResult Hub::attach(const JobId& id, const SubscriberPtr& subscriber) {
    if (!subscriber) {
        return AttachResult::NotFound;
    }

    // Snapshot and registration happen under the hub lock so that no
    // broadcast can slip between them.
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = registry_.snapshot(id);
    if (!current) {
        LOG_DEBUG("Attach to unknown job: " + id);
        return AttachResult::NotFound;
    }

    if (!subscriber->owner_.empty()) {
        if (subscriber->owner_ != id) {
            LOG_WARN("Subscriber already attached to " + subscriber->owner_ + ", refusing " + id);
            return AttachResult::AlreadyAttached;
        }
        return AttachResult::Attached;
    }

    if (!subscriber->push(Event{EventKind::Snapshot, *current})) {
        LOG_DEBUG("Subscriber closed before attach completed: " + id);
        return AttachResult::Attached;
    }

    auto& list = subscribers_[id];
    list.push_back(subscriber);
    subscriber->owner_ = id;
    LOG_DEBUG("Subscriber attached to " + id + " (" + std::to_string(list.size()) + " total)");
    return AttachResult::Attached;
}

void Hub::detach(const JobId& id, const SubscriberPtr& subscriber) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        auto& list = it->second;
        auto found = std::find(list.begin(), list.end(), subscriber);
        if (found == list.end()) {
            return;
        }
        (*found)->owner_.clear();
        list.erase(found);
        if (list.empty()) {
            subscribers_.erase(it);
        }
    } catch (...) {
        LOG_ERROR("Failed to detach subscriber from job: " + id);
    }
}

std::size_t Hub::broadcast(const JobId& id, EventKind kind, const Snapshot& snapshot) noexcept {
    std::size_t delivered = 0;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return 0;
        }

        Event event{kind, snapshot};
        auto& list = it->second;
        std::size_t before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(), [&](const SubscriberPtr& subscriber) {
            if (subscriber->push(event)) {
                ++delivered;
                return false;
            }
            subscriber->owner_.clear();
            return true;  // closed: prune
        }), list.end());

        if (list.size() != before) {
            LOG_DEBUG("Pruned " + std::to_string(before - list.size()) + " closed subscriber(s) from " + id);
        }
        if (list.empty()) {
            subscribers_.erase(it);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Broadcast to " + id + " interrupted: " + std::string(e.what()));
    } catch (...) {
        LOG_WARN("Broadcast to " + id + " interrupted by unknown error");
    }
    LOG_TRACE("Broadcast " + std::string(toString(kind)) + " for " + id + " to " + std::to_string(delivered) + " subscriber(s)");
    return delivered;
}

std::size_t Hub::subscriberCount(const JobId& id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(id);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void Hub::closeAll() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : subscribers_) {
        for (auto& subscriber : entry.second) {
            subscriber->owner_.clear();
            subscriber->close();
        }
    }
    subscribers_.clear();
}

}
