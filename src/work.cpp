/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/work.hpp"
#include "simpleshare/job.hpp"
#include "simpleshare/logger.hpp"
#include "simpleshare/pool.hpp"
#include "simpleshare/registry.hpp"

namespace simpleshare {

namespace {
constexpr std::size_t kMaxUrlBytes = 8192;

std::string trimCopy(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}
}

Work::Work(Registry& registry, Pool& pool) noexcept
    : registry_(registry), pool_(pool) {}

SubmitResult Work::submit(const std::string& url) {
    std::string source = trimCopy(url);
    if (source.empty()) {
        LOG_DEBUG("Rejected submission: missing url");
        return {false, "", SubmissionError::InvalidUrl, "missing url"};
    }
    if (source.size() > kMaxUrlBytes) {
        LOG_DEBUG("Rejected submission: url exceeds " + std::to_string(kMaxUrlBytes) + " bytes");
        return {false, "", SubmissionError::InvalidUrl, "url too long"};
    }

    JobId jobId = registry_.create(source);

    if (!pool_.submit(jobId)) {
        LOG_ERROR("Failed to queue job: " + jobId);
        (void)registry_.update(jobId, JobPatch{Status::Error, std::nullopt, std::nullopt,
                                               std::string("service is shutting down")});
        return {false, jobId, SubmissionError::Unavailable, "service is shutting down"};
    }

    LOG_INFO("Job submitted: " + jobId + " (" + source + ")");
    return {true, jobId, SubmissionError::None, ""};
}

}
