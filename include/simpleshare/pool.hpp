/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "simpleshare/types.hpp"

namespace simpleshare {

using JobTask = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads, each running one job task at a time.
// Jobs wait here, in the queued state, until a worker is free.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobTask task);
    void stop() noexcept;
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;
    
    [[nodiscard]] std::size_t activeCount() const noexcept { return active_.load(); }

private:
    void workerLoop(int workerId);
    
    int workers_;
    JobTask task_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> active_{0};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::queue<JobId> jobQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
