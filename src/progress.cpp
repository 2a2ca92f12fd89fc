/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/progress.hpp"
#include "simpleshare/logger.hpp"
#include <algorithm>
#include <cmath>
#include <regex>

namespace simpleshare {

namespace {
const std::regex& fetcherPattern() {
    static const std::regex pattern(R"(\[download\]\s+([0-9.]+)%)");
    return pattern;
}

const std::regex& durationPattern() {
    static const std::regex pattern(R"(Duration:\s*([0-9]+):([0-9]{2}):([0-9.]+))");
    return pattern;
}

std::string trimCopy(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<double> toDouble(const std::string& text) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int64_t> toMicroseconds(const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value < 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;  // "N/A" before the first frame
    }
}
}

std::vector<std::string> LineBuffer::feed(std::string_view chunk) {
    std::vector<std::string> lines;
    pending_.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    std::size_t newline = pending_.find('\n', start);
    while (newline != std::string::npos) {
        std::size_t end = newline;
        if (end > start && pending_[end - 1] == '\r') {
            --end;
        }
        if (end > start) {
            lines.emplace_back(pending_, start, end - start);
        }
        start = newline + 1;
        newline = pending_.find('\n', start);
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> LineBuffer::flush() {
    std::string rest;
    rest.swap(pending_);
    if (!rest.empty() && rest.back() == '\r') {
        rest.pop_back();
    }
    if (rest.empty()) {
        return std::nullopt;
    }
    return rest;
}

ProgressUpdate parseFetcherLine(const std::string& line) {
    if (line.empty()) {
        return {};
    }

    std::smatch match;
    if (std::regex_search(line, match, fetcherPattern())) {
        if (auto value = toDouble(match[1].str())) {
            // Clamp first: lround of an out-of-range value is unspecified
            long rounded = std::lround(std::clamp(*value, 0.0, 100.0));
            return {Signal::Percent, static_cast<int>(rounded)};
        }
    }
    return {Signal::Alive, 0};
}

std::optional<double> parseDurationLine(const std::string& line) {
    std::smatch match;
    if (!std::regex_search(line, match, durationPattern())) {
        return std::nullopt;
    }

    try {
        long hours = std::stol(match[1].str());
        long minutes = std::stol(match[2].str());
        auto seconds = toDouble(match[3].str());
        if (!seconds) {
            return std::nullopt;
        }
        return static_cast<double>(hours) * 3600.0 + static_cast<double>(minutes) * 60.0 + *seconds;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int percentOf(double elapsedSeconds, double totalSeconds) noexcept {
    if (!(totalSeconds > 0.0) || !(elapsedSeconds > 0.0)) {
        return 0;
    }
    double ratio = std::round(elapsedSeconds / totalSeconds * 100.0);
    return static_cast<int>(std::min(100.0, ratio));
}

void DurationProbe::set(double seconds) noexcept {
    if (!(seconds > 0.0)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    seconds_ = seconds;
}

std::optional<double> DurationProbe::seconds() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return seconds_;
}

bool DurationProbe::scan(const std::string& line) {
    auto parsed = parseDurationLine(line);
    if (!parsed || !(*parsed > 0.0)) {
        return false;
    }
    set(*parsed);
    LOG_DEBUG("Discovered media duration: " + std::to_string(*parsed) + "s");
    return true;
}

ProgressUpdate TranscodeProgress::feedLine(const std::string& raw) {
    std::string line = trimCopy(raw);
    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
        return {};
    }

    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);

    if (key == "out_time_us" || key == "out_time_ms") {
        // Both keys are microseconds in ffmpeg's progress output.
        if (auto us = toMicroseconds(value)) {
            outTimeUs_ = *us;
        }
    } else if (key == "duration") {
        if (auto seconds = toDouble(value)) {
            if (!probe_.seconds()) {
                probe_.set(*seconds);
            }
        }
    } else if (key == "progress") {
        if (value == "end") {
            finished_ = true;
        }
        return closeBlock();
    }
    return {};
}

ProgressUpdate TranscodeProgress::closeBlock() {
    if (!outTimeUs_) {
        return {};
    }
    int64_t outTimeUs = *outTimeUs_;
    outTimeUs_.reset();

    auto total = probe_.seconds();
    if (!total) {
        return {Signal::Alive, lastSurfaced_};
    }

    int percent = percentOf(static_cast<double>(outTimeUs) / 1'000'000.0, *total);
    if (percent == lastSurfaced_) {
        return {};
    }
    lastSurfaced_ = percent;
    return {Signal::Percent, percent};
}

}
