/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace simpleshare {

using ChunkHandler = std::function<void(std::string_view chunk)>;
using ThreadStarter = std::function<std::thread(std::function<void()>)>;

struct ExitStatus {
    int code = -1;          // exit code, or 128 + signal number
    bool signaled = false;
    std::string stderrTail; // last bytes written to stderr

    [[nodiscard]] bool ok() const noexcept { return code == 0 && !signaled; }
};

// Runs an external program to completion. stdout and stderr are read
// by two threads while a third waits for exit; all three are joined
// before run() returns. Handlers are called from the reader threads.
// Throws JobError(ProcessSpawn) when the program or its I/O threads
// cannot be started; the child is killed and reaped first.
class Process final {
public:
    Process(std::string program, std::vector<std::string> args);

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    void onStdout(ChunkHandler handler) { stdoutHandler_ = std::move(handler); }
    void onStderr(ChunkHandler handler) { stderrHandler_ = std::move(handler); }
    void setStderrTailLimit(std::size_t bytes) noexcept { tailLimit_ = bytes; }
    void setThreadStarter(ThreadStarter starter) { startThread_ = std::move(starter); }

    [[nodiscard]] ExitStatus run();

    [[nodiscard]] std::string commandLine() const;

private:
    std::string program_;
    std::vector<std::string> args_;
    ChunkHandler stdoutHandler_;
    ChunkHandler stderrHandler_;
    std::size_t tailLimit_ = 4096;
    ThreadStarter startThread_;
};

}
