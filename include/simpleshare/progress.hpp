/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simpleshare {

enum class Signal : uint8_t {
    None,     // nothing to surface
    Percent,  // new percentage in ProgressUpdate::percent
    Alive     // process is working, progress unknown
};

struct ProgressUpdate {
    Signal signal = Signal::None;
    int percent = 0;
};

// Splits a byte stream into lines. A partial trailing line is kept
// until the chunk that completes it arrives.
class LineBuffer {
public:
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);
    // Returns whatever is left once the stream is closed.
    [[nodiscard]] std::optional<std::string> flush();

private:
    std::string pending_;
};

// "[download]  42.0% of 10MiB at 1MiB/s ETA 00:10" -> Percent 42.
// Any other non-empty line -> Alive.
[[nodiscard]] ProgressUpdate parseFetcherLine(const std::string& line);

// "Duration: 00:01:30.50, start: ..." -> 90.5 seconds.
[[nodiscard]] std::optional<double> parseDurationLine(const std::string& line);

// min(100, round(elapsed / total * 100)), 0 for a non-positive total.
[[nodiscard]] int percentOf(double elapsedSeconds, double totalSeconds) noexcept;

// Total media duration, written by the diagnostic reader and read by
// the progress reader.
class DurationProbe {
public:
    void set(double seconds) noexcept;
    [[nodiscard]] std::optional<double> seconds() const noexcept;

    // Scans one diagnostic line; returns true when it carried the duration.
    bool scan(const std::string& line);

private:
    mutable std::mutex mutex_;
    std::optional<double> seconds_;
};

// Parses the transcoder's key=value progress channel one line at a time.
// A block ends with a "progress" key; only then is a signal produced.
class TranscodeProgress {
public:
    explicit TranscodeProgress(DurationProbe& probe) noexcept : probe_(probe) {}

    [[nodiscard]] ProgressUpdate feedLine(const std::string& line);

    [[nodiscard]] int lastSurfaced() const noexcept { return lastSurfaced_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    ProgressUpdate closeBlock();

    DurationProbe& probe_;
    std::optional<int64_t> outTimeUs_;
    int lastSurfaced_ = 0;
    bool finished_ = false;
};

}
