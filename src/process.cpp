/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/process.hpp"
#include "simpleshare/job.hpp"
#include "simpleshare/logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <thread>
#include <csignal>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace simpleshare {

namespace {

// Owns a pipe's two ends.
struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw JobError(ErrorKind::ProcessSpawn,
                           std::string("pipe creation failed: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int readEnd() const noexcept { return fds[0]; }
    int writeEnd() const noexcept { return fds[1]; }
    void closeRead() noexcept {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() noexcept {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

struct SpawnActions {
    posix_spawn_file_actions_t actions;
    SpawnActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions); }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;
};

// Reads fd until EOF. Handler failures are recorded; the pipe keeps
// draining so the child never blocks on a full pipe.
void drain(int fd, const ChunkHandler& handler, std::exception_ptr& failure,
           std::string* tail, std::size_t tailLimit) {
    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        std::string_view chunk(buffer.data(), static_cast<std::size_t>(n));
        if (tail) {
            tail->append(chunk.data(), chunk.size());
            if (tail->size() > tailLimit) {
                tail->erase(0, tail->size() - tailLimit);
            }
        }
        if (handler && !failure) {
            try {
                handler(chunk);
            } catch (...) {
                failure = std::current_exception();
            }
        }
    }
}

}

Process::Process(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)),
      startThread_([](std::function<void()> body) { return std::thread(std::move(body)); }) {}

std::string Process::commandLine() const {
    std::string line = program_;
    for (const auto& arg : args_) {
        line += " ";
        line += arg;
    }
    return line;
}

ExitStatus Process::run() {
    Pipe out;
    Pipe err;
    SpawnActions spawn;

    posix_spawn_file_actions_addopen(&spawn.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&spawn.actions, out.writeEnd(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&spawn.actions, err.writeEnd(), STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(const_cast<char*>(program_.c_str()));
    for (const auto& arg : args_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program_.c_str(), &spawn.actions, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw JobError(ErrorKind::ProcessSpawn,
                       program_ + " spawn failed: " + std::strerror(rc));
    }
    LOG_DEBUG("Spawned pid " + std::to_string(pid) + ": " + commandLine());

    // Parent keeps only the read ends, otherwise EOF never arrives
    out.closeWrite();
    err.closeWrite();

    ExitStatus status;
    std::exception_ptr stdoutFailure;
    std::exception_ptr stderrFailure;
    int waitStatus = 0;
    bool waited = false;

    auto waitForChild = [&] {
        while (::waitpid(pid, &waitStatus, 0) < 0) {
            if (errno != EINTR) {
                return;
            }
        }
        waited = true;
    };

    std::thread stdoutReader;
    std::thread stderrReader;
    std::thread waiter;
    try {
        stdoutReader = startThread_([&] {
            drain(out.readEnd(), stdoutHandler_, stdoutFailure, nullptr, 0);
        });
        stderrReader = startThread_([&] {
            drain(err.readEnd(), stderrHandler_, stderrFailure, &status.stderrTail, tailLimit_);
        });
        waiter = startThread_(waitForChild);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start I/O threads for " + program_ + ": " + e.what());
        // Killing the child closes its pipe ends, so started readers reach EOF
        ::kill(pid, SIGKILL);
        if (!waiter.joinable()) {
            waitForChild();
        }
        for (std::thread* thread : {&stdoutReader, &stderrReader, &waiter}) {
            if (thread->joinable()) {
                thread->join();
            }
        }
        throw JobError(ErrorKind::ProcessSpawn,
                       program_ + " spawn failed: cannot start I/O threads: " + e.what());
    }

    stdoutReader.join();
    stderrReader.join();
    waiter.join();

    if (!waited) {
        throw JobError(ErrorKind::ProcessExecution, program_ + ": lost track of child process");
    }
    if (WIFEXITED(waitStatus)) {
        status.code = WEXITSTATUS(waitStatus);
    } else if (WIFSIGNALED(waitStatus)) {
        status.signaled = true;
        status.code = 128 + WTERMSIG(waitStatus);
    }
    LOG_DEBUG(program_ + " (pid " + std::to_string(pid) + ") exited with " + std::to_string(status.code));

    if (stdoutFailure) {
        std::rethrow_exception(stdoutFailure);
    }
    if (stderrFailure) {
        std::rethrow_exception(stderrFailure);
    }
    return status;
}

}
