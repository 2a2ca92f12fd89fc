/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/pool.hpp"
#include "simpleshare/logger.hpp"

namespace simpleshare {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobTask task) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!task) {
        LOG_ERROR("Invalid job task provided");
        return false;
    }

    task_ = std::move(task);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();
    
    // Running jobs finish their current stage processes before the join returns
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
    
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        std::queue<JobId>().swap(jobQueue_);
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued job(s) never started");
    }
    
    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_WARN("Cannot submit job to stopped pool: " + jobId);
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(jobId);
        }
        
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue job: " + jobId);
        return false;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG("Worker thread started");
    
    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] { 
                return !jobQueue_.empty() || shutdown_.load(); 
            });
            
            if (shutdown_.load()) {
                break;
            }
            
            jobId = std::move(jobQueue_.front());
            jobQueue_.pop();
        }
        
        JobLogScope scope(jobId);
        LOG_INFO("Claimed job");
        ++active_;
        try {
            task_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Job task error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Unknown job task error");
        }
        --active_;
    }
    
    LOG_DEBUG("Worker thread stopped");
}

}
