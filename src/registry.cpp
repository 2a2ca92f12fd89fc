/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/registry.hpp"
#include "simpleshare/logger.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <random>
#include <sstream>
#include <iomanip>
#include <unistd.h>

namespace simpleshare {

Registry::Registry(std::size_t partitions) {
    if (partitions == 0) {
        partitions = 1;
    }
    partitions_.reserve(partitions);
    for (std::size_t i = 0; i < partitions; ++i) {
        partitions_.push_back(std::make_unique<Partition>());
    }
    LOG_DEBUG("Registry created with " + std::to_string(partitions) + " partitions");
}

JobId Registry::create(const std::string& source) {
    JobId id = generateId();
    auto now = std::chrono::system_clock::now();

    JobRecord record{id, source, Snapshot{}, now, now};

    Partition& partition = partitionFor(id);
    {
        std::lock_guard<std::mutex> lock(partition.mutex);
        // generateId() never repeats within a process
        partition.jobs.emplace(id, std::move(record));
    }

    LOG_DEBUG("Job registered: " + id + " (" + source + ")");
    return id;
}

std::optional<JobRecord> Registry::get(const JobId& id) const {
    Partition& partition = partitionFor(id);
    std::lock_guard<std::mutex> lock(partition.mutex);
    auto it = partition.jobs.find(id);
    if (it == partition.jobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Snapshot> Registry::snapshot(const JobId& id) const {
    Partition& partition = partitionFor(id);
    std::lock_guard<std::mutex> lock(partition.mutex);
    auto it = partition.jobs.find(id);
    if (it == partition.jobs.end()) {
        return std::nullopt;
    }
    return it->second.snapshot;
}

bool Registry::exists(const JobId& id) const {
    Partition& partition = partitionFor(id);
    std::lock_guard<std::mutex> lock(partition.mutex);
    return partition.jobs.find(id) != partition.jobs.end();
}

std::optional<Snapshot> Registry::update(const JobId& id, const JobPatch& patch) {
    Partition& partition = partitionFor(id);
    std::lock_guard<std::mutex> lock(partition.mutex);
    auto it = partition.jobs.find(id);
    if (it == partition.jobs.end()) {
        LOG_WARN("Update for unknown job: " + id);
        return std::nullopt;
    }

    JobRecord& record = it->second;
    Snapshot merged = apply(record.snapshot, patch);
    if (merged != record.snapshot) {
        record.snapshot = merged;
        record.updated = std::chrono::system_clock::now();
    }
    return merged;
}

std::size_t Registry::size() const noexcept {
    std::size_t total = 0;
    for (const auto& partition : partitions_) {
        std::lock_guard<std::mutex> lock(partition->mutex);
        total += partition->jobs.size();
    }
    return total;
}

Registry::Partition& Registry::partitionFor(const JobId& id) const noexcept {
    std::size_t index = std::hash<JobId>{}(id) % partitions_.size();
    return *partitions_[index];
}

JobId Registry::generateId() {
    static std::atomic<uint64_t> counter{0};
    static const uint64_t salt = std::random_device{}();

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::hex << now << "-" << getpid() << "-" << (salt & 0xffff) << "-" << unique_counter;
    return ss.str();
}

}
