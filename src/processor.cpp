/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/processor.hpp"
#include "simpleshare/hub.hpp"
#include "simpleshare/logger.hpp"
#include "simpleshare/process.hpp"
#include "simpleshare/progress.hpp"
#include "simpleshare/registry.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace {
std::mutex g_output_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return buf;
}

void console(const std::string& jobId, const char* color, const std::string& state, const std::string& detail = "") {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << jobId << "  " << color << state << "\033[0m";
    if (!detail.empty()) {
        std::cout << "  " << detail;
    }
    std::cout << "\n" << std::flush;
}

bool isPartialDownload(const std::string& name) {
    auto endsWith = [&](const std::string& suffix) {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return endsWith(".part") || endsWith(".ytdl") || endsWith(".temp");
}

std::string trimTail(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    auto begin = text.find_first_not_of("\r\n ");
    return begin == std::string::npos ? std::string() : text.substr(begin);
}
}

namespace simpleshare {

Processor::Processor(Registry& registry, Hub& hub, Config config)
    : registry_(registry), hub_(hub), config_(std::move(config)) {
    LOG_DEBUG("Processor created for storage: " + config_.storage.string() +
              " (fetcher: " + config_.fetcher + ", transcoder: " + config_.transcoder + ")");
}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " processing job: " + jobId);

    try {
        auto record = registry_.get(jobId);
        if (!record) {
            LOG_WARN("Job not found: " + jobId);
            return ProcessResult::NotFound;
        }
        if (record->snapshot.status != Status::Queued) {
            LOG_DEBUG("Job already claimed: " + jobId);
            return ProcessResult::NotFound;
        }

        console(jobId, "\033[33m", "running");
        auto startTime = std::chrono::steady_clock::now();

        advance(jobId, JobPatch{Status::Starting, 0, std::nullopt, std::nullopt}, EventKind::Update);

        download(jobId, record->source);
        auto downloaded = locateDownload(jobId);

        convert(jobId, downloaded);
        publish(jobId);

        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
        std::ostringstream detail;
        detail << std::fixed << std::setprecision(1) << elapsed << "s";
        console(jobId, "\033[32m", "done", detail.str());
        LOG_INFO("JOB COMPLETED: " + jobId + " -> " + publicUrl(jobId));
        return ProcessResult::Success;

    } catch (const JobError& e) {
        LOG_WARN("Job failed (" + std::string(toString(e.kind())) + "): " + jobId + " - " + e.what());
        fail(jobId, e.what());
        return ProcessResult::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing job " + jobId + ": " + std::string(e.what()));
        fail(jobId, "Internal processing error: " + std::string(e.what()));
        return ProcessResult::Failed;
    } catch (...) {
        LOG_ERROR("Unknown exception processing job: " + jobId);
        fail(jobId, "Unknown internal processing error");
        return ProcessResult::Failed;
    }
}

std::filesystem::path Processor::outputPath(const JobId& jobId) const {
    return config_.storage / (jobId + "." + config_.outputExtension);
}

std::string Processor::publicUrl(const JobId& jobId) const {
    return config_.publicBase() + "/public/" + jobId + "." + config_.outputExtension;
}

void Processor::advance(const JobId& jobId, const JobPatch& patch, EventKind kind) {
    auto snapshot = registry_.update(jobId, patch);
    if (!snapshot) {
        throw JobError(ErrorKind::Internal, "job record disappeared: " + jobId);
    }
    hub_.broadcast(jobId, kind, *snapshot);
}

void Processor::fail(const JobId& jobId, const std::string& message) noexcept {
    try {
        console(jobId, "\033[31m", "failed", message.substr(0, message.find('\n')));
        auto snapshot = registry_.update(jobId, JobPatch{Status::Error, std::nullopt, std::nullopt, message});
        if (snapshot) {
            hub_.broadcast(jobId, EventKind::Error, *snapshot);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to record failure for job " + jobId + ": " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Unknown error recording failure for job: " + jobId);
    }
}

void Processor::download(const JobId& jobId, const std::string& source) {
    advance(jobId, JobPatch{Status::Downloading, 0, std::nullopt, std::nullopt}, EventKind::Update);

    auto outputTemplate = (config_.storage / (jobId + ".%(ext)s")).string();
    Process fetcher(config_.fetcher, config_.fetcherArgs(outputTemplate, source));

    LineBuffer lines;
    auto handleLine = [&](const std::string& line) {
        ProgressUpdate update = parseFetcherLine(line);
        if (update.signal == Signal::Percent) {
            advance(jobId, JobPatch{Status::Downloading, update.percent, std::nullopt, std::nullopt},
                    EventKind::DownloadProgress);
        } else if (update.signal == Signal::Alive) {
            advance(jobId, JobPatch{Status::Downloading, std::nullopt, std::nullopt, std::nullopt},
                    EventKind::Message);
        }
    };
    fetcher.onStdout([&](std::string_view chunk) {
        for (const auto& line : lines.feed(chunk)) {
            handleLine(line);
        }
    });

    ExitStatus status = fetcher.run();
    if (auto rest = lines.flush()) {
        handleLine(*rest);
    }

    if (!status.ok()) {
        throw JobError(ErrorKind::ProcessExecution, describeFailure(config_.fetcher, status));
    }
    LOG_DEBUG("Download finished: " + jobId);
}

std::filesystem::path Processor::locateDownload(const JobId& jobId) const {
    const std::string prefix = jobId + ".";
    std::vector<std::filesystem::path> matches;

    std::error_code ec;
    for (std::filesystem::directory_iterator it(config_.storage, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) == 0 && !isPartialDownload(name)) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        throw JobError(ErrorKind::ArtifactMissing,
                       "cannot read storage directory " + config_.storage.string() + ": " + ec.message());
    }
    if (matches.empty()) {
        throw JobError(ErrorKind::ArtifactMissing, "downloaded file not found");
    }

    std::sort(matches.begin(), matches.end());
    if (matches.size() > 1) {
        LOG_WARN("Multiple downloads for " + jobId + ", using " + matches.front().filename().string());
    }
    return matches.front();
}

void Processor::convert(const JobId& jobId, const std::filesystem::path& downloaded) {
    advance(jobId, JobPatch{Status::Converting, 0, std::nullopt, std::nullopt}, EventKind::Update);

    std::filesystem::path input = downloaded;
    std::filesystem::path output = outputPath(jobId);
    if (input == output) {
        // Already in the target container; the transcoder cannot write over its input
        input = config_.storage / (jobId + ".source." + config_.outputExtension);
        std::filesystem::rename(downloaded, input);
    }

    DurationProbe probe;
    TranscodeProgress progress(probe);
    LineBuffer outLines;
    LineBuffer errLines;

    auto handleLine = [&](const std::string& line) {
        ProgressUpdate update = progress.feedLine(line);
        if (update.signal == Signal::Percent) {
            advance(jobId, JobPatch{Status::Converting, update.percent, std::nullopt, std::nullopt},
                    EventKind::ConvertProgress);
        } else if (update.signal == Signal::Alive) {
            advance(jobId, JobPatch{Status::Converting, std::nullopt, std::nullopt, std::nullopt},
                    EventKind::ConvertProgress);
        }
    };

    Process transcoder(config_.transcoder, config_.transcoderArgs(input, output));
    transcoder.onStdout([&](std::string_view chunk) {
        for (const auto& line : outLines.feed(chunk)) {
            handleLine(line);
        }
    });
    transcoder.onStderr([&](std::string_view chunk) {
        for (const auto& line : errLines.feed(chunk)) {
            if (!probe.seconds()) {
                probe.scan(line);
            }
        }
    });

    ExitStatus status;
    try {
        status = transcoder.run();
        if (auto rest = outLines.flush()) {
            handleLine(*rest);
        }
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(input, ec);
        throw;
    }

    std::error_code ec;
    if (!std::filesystem::remove(input, ec) || ec) {
        LOG_WARN("Could not remove intermediate file " + input.string() +
                 (ec ? ": " + ec.message() : std::string()));
    }

    if (!status.ok()) {
        throw JobError(ErrorKind::ProcessExecution, describeFailure(config_.transcoder, status));
    }
    if (!progress.finished()) {
        LOG_WARN("Transcoder exited without its end-of-progress marker: " + jobId +
                 " (last at " + std::to_string(progress.lastSurfaced()) + "%)");
    }
    LOG_DEBUG("Conversion finished: " + jobId);
}

void Processor::publish(const JobId& jobId) {
    std::error_code ec;
    if (!std::filesystem::exists(outputPath(jobId), ec)) {
        throw JobError(ErrorKind::ArtifactMissing, "converted file not found");
    }
    advance(jobId, JobPatch{Status::Done, 100, publicUrl(jobId), std::nullopt}, EventKind::Done);
}

std::string Processor::describeFailure(const std::string& program, const ExitStatus& status) {
    std::string name = std::filesystem::path(program).filename().string();
    std::string message = name + " failed (" +
        (status.signaled ? "signal " + std::to_string(status.code - 128)
                         : "exit " + std::to_string(status.code)) + ")";
    std::string tail = trimTail(status.stderrTail);
    if (!tail.empty()) {
        message += ": " + tail;
    }
    return message;
}

}
