/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/event.hpp"

namespace simpleshare {

nlohmann::json toJson(const Snapshot& snapshot) {
    nlohmann::json body;
    body["status"] = toString(snapshot.status);
    body["progress"] = snapshot.progress;
    body["url"] = snapshot.url ? nlohmann::json(*snapshot.url) : nlohmann::json(nullptr);
    body["error"] = snapshot.error ? nlohmann::json(*snapshot.error) : nlohmann::json(nullptr);
    return body;
}

std::string formatSse(const Event& event) {
    std::string frame;
    if (event.kind != EventKind::Snapshot) {
        frame += "event: ";
        frame += toString(event.kind);
        frame += "\n";
    }
    // dump() escapes newlines, so the payload stays on one data line
    frame += "data: ";
    frame += toJson(event.snapshot).dump();
    frame += "\n\n";
    return frame;
}

}
