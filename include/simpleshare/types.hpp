#pragma once
#include <cstdint>
#include <string>

namespace simpleshare {

// Job lifecycle states, in progression order.
enum class Status : std::uint8_t { Queued, Starting, Downloading, Converting, Done, Error };

// Tags carried by hub events. Snapshot is the untagged frame sent on attach.
enum class EventKind : std::uint8_t {
    Snapshot,
    Update,
    DownloadProgress,
    ConvertProgress,
    Message,
    Done,
    Error
};

// Opaque job identifier.
using JobId = std::string;

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(EventKind kind) noexcept;

[[nodiscard]] constexpr bool isTerminal(Status status) noexcept {
    return status == Status::Done || status == Status::Error;
}

} // namespace simpleshare
