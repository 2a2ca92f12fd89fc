/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "simpleshare/types.hpp"

namespace simpleshare {

// Complete observable state of a job. Every event carries one.
struct Snapshot {
    Status status = Status::Queued;
    int progress = 0;
    std::optional<std::string> url;
    std::optional<std::string> error;

    bool operator==(const Snapshot& other) const noexcept {
        return status == other.status && progress == other.progress &&
               url == other.url && error == other.error;
    }
    bool operator!=(const Snapshot& other) const noexcept { return !(*this == other); }
};

// Partial update. Absent fields are left untouched by apply().
struct JobPatch {
    std::optional<Status> status;
    std::optional<int> progress;
    std::optional<std::string> url;
    std::optional<std::string> error;
};

// Merges a patch into a snapshot.
// - terminal snapshots are returned unchanged
// - status only moves forward, except into Error; a patch whose status
//   would move backward is discarded as a whole
// - progress is clamped to [0, 100] and never decreases within a stage
[[nodiscard]] Snapshot apply(const Snapshot& current, const JobPatch& patch) noexcept;

struct JobRecord {
    JobId id;
    std::string source;
    Snapshot snapshot;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point updated;
};

enum class ErrorKind : uint8_t {
    ProcessSpawn,
    ProcessExecution,
    ArtifactMissing,
    Internal
};

// Job-scoped failure. Fatal to the job that raised it, never to the service.
class JobError : public std::runtime_error {
public:
    JobError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

}
