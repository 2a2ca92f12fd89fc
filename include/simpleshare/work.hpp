/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "simpleshare/types.hpp"

namespace simpleshare {

class Registry;
class Pool;

enum class SubmissionError : uint8_t {
    None = 0,
    InvalidUrl,
    Unavailable
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Job submission: validates the request, registers the job and hands
// it to the pool. Never waits for the pipeline.
class Work final {
public:
    Work(Registry& registry, Pool& pool) noexcept;

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    [[nodiscard]] SubmitResult submit(const std::string& url);

private:
    Registry& registry_;
    Pool& pool_;
};

}
