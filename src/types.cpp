/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/types.hpp"

namespace simpleshare {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued:      return "queued";
        case Status::Starting:    return "starting";
        case Status::Downloading: return "downloading";
        case Status::Converting:  return "converting";
        case Status::Done:        return "done";
        case Status::Error:       return "error";
    }
    return "unknown";
}

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Snapshot:         return "snapshot";
        case EventKind::Update:           return "update";
        case EventKind::DownloadProgress: return "download-progress";
        case EventKind::ConvertProgress:  return "convert-progress";
        case EventKind::Message:          return "message";
        case EventKind::Done:             return "done";
        case EventKind::Error:            return "error";
    }
    return "unknown";
}

}
