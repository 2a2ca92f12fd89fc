/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/job.hpp"
#include <algorithm>

namespace simpleshare {

namespace {
int clampProgress(int value) noexcept {
    return std::clamp(value, 0, 100);
}
}

Snapshot apply(const Snapshot& current, const JobPatch& patch) noexcept {
    if (isTerminal(current.status)) {
        return current;
    }

    Snapshot next = current;

    if (patch.status) {
        Status target = *patch.status;
        if (target != Status::Error &&
            static_cast<uint8_t>(target) < static_cast<uint8_t>(current.status)) {
            // Stale patch from an earlier stage: none of it applies
            return current;
        }
        next.status = target;
    }

    if (patch.progress) {
        int value = clampProgress(*patch.progress);
        // Same stage: keep the high-water mark. New stage: take the value as-is.
        if (next.status == current.status) {
            next.progress = std::max(current.progress, value);
        } else {
            next.progress = value;
        }
    }

    if (patch.url) {
        next.url = patch.url;
    }
    if (patch.error) {
        next.error = patch.error;
    }

    return next;
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ProcessSpawn:     return "process-spawn";
        case ErrorKind::ProcessExecution: return "process-execution";
        case ErrorKind::ArtifactMissing:  return "artifact-missing";
        case ErrorKind::Internal:         return "internal";
    }
    return "unknown";
}

}
