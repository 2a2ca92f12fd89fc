/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "simpleshare/config.hpp"
#include "simpleshare/job.hpp"
#include "simpleshare/types.hpp"

namespace simpleshare {

class Registry;
class Hub;
struct ExitStatus;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound
};

// Drives one job through fetch -> transcode -> publish. Every state
// change is written to the registry and the merged snapshot broadcast.
// Failures end the job in the error state and never propagate.
class Processor {
public:
    Processor(Registry& registry, Hub& hub, Config config);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

    [[nodiscard]] std::filesystem::path outputPath(const JobId& jobId) const;
    [[nodiscard]] std::string publicUrl(const JobId& jobId) const;

private:
    void advance(const JobId& jobId, const JobPatch& patch, EventKind kind);
    void fail(const JobId& jobId, const std::string& message) noexcept;

    void download(const JobId& jobId, const std::string& source);
    [[nodiscard]] std::filesystem::path locateDownload(const JobId& jobId) const;
    void convert(const JobId& jobId, const std::filesystem::path& input);
    void publish(const JobId& jobId);

    [[nodiscard]] static std::string describeFailure(const std::string& program, const ExitStatus& status);

    Registry& registry_;
    Hub& hub_;
    Config config_;
};

}
