/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "simpleshare/job.hpp"
#include "simpleshare/types.hpp"

namespace simpleshare {

struct Event {
    EventKind kind = EventKind::Snapshot;
    Snapshot snapshot;
};

// {"status": ..., "progress": ..., "url": ..., "error": ...}
[[nodiscard]] nlohmann::json toJson(const Snapshot& snapshot);

// Server-Sent Events frame. Snapshot events carry no "event:" line.
[[nodiscard]] std::string formatSse(const Event& event);

}
