/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "simpleshare/job.hpp"
#include "simpleshare/types.hpp"

namespace simpleshare {

// In-memory job store, partitioned by identifier. Records are never evicted.
class Registry final {
public:
    explicit Registry(std::size_t partitions = 16);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    [[nodiscard]] JobId create(const std::string& source);
    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const;
    [[nodiscard]] std::optional<Snapshot> snapshot(const JobId& id) const;
    [[nodiscard]] bool exists(const JobId& id) const;

    // Returns the merged snapshot, or nullopt for an unknown id.
    std::optional<Snapshot> update(const JobId& id, const JobPatch& patch);

    [[nodiscard]] std::size_t size() const noexcept;

private:
    struct Partition {
        mutable std::mutex mutex;
        std::unordered_map<JobId, JobRecord> jobs;
    };

    [[nodiscard]] Partition& partitionFor(const JobId& id) const noexcept;
    [[nodiscard]] static JobId generateId();

    std::vector<std::unique_ptr<Partition>> partitions_;
};

}
