/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/server.hpp"
#include "simpleshare/http.hpp"
#include "simpleshare/logger.hpp"
#include "simpleshare/pool.hpp"
#include "simpleshare/processor.hpp"

namespace simpleshare {

// Note: Signal handling is done by the daemon (simpleshared.cpp), not by Server class

Server::Server(Config config)
    : config_(std::move(config)), hub_(registry_) {
    LOG_DEBUG("Server created - storage: " + config_.storage.string() +
              ", workers: " + std::to_string(config_.workers));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting simpleshare server...");

    if (!createStorage()) {
        LOG_ERROR("Failed to create storage directory");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("simpleshare Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Storage: " + config_.storage.string());
    LOG_DEBUG("Public URL: " + config_.publicBase());
    LOG_DEBUG("Fetcher: " + config_.fetcher);
    LOG_DEBUG("Transcoder: " + config_.transcoder);
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("========================================");

    try {
        processor_ = std::make_unique<Processor>(registry_, hub_, config_);
        pool_ = std::make_unique<Pool>(config_.workers);
        work_ = std::make_unique<Work>(registry_, *pool_);

        if (!pool_->start([this](const JobId& jobId, int workerId) {
            (void)processor_->process(jobId, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        http_ = std::make_unique<HttpListener>(*work_, registry_, hub_, config_.bindAddress, config_.port,
                                               config_.storage);
        if (!http_->start()) {
            LOG_ERROR("Failed to start HTTP listener");
            pool_->stop();
            return false;
        }

        running_.store(true);
        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (pool_) {
            pool_->stop();
        }
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    // Subscribers first, so event streams release their connections
    hub_.closeAll();

    if (http_) {
        http_->stop();
    }

    if (pool_) {
        if (pool_->activeCount() > 0) {
            LOG_INFO("Waiting for " + std::to_string(pool_->activeCount()) + " running job(s)");
        }
        pool_->stop();
    }

    http_.reset();
    work_.reset();
    pool_.reset();
    processor_.reset();

    LOG_INFO("Server shutdown complete");
}

SubmitResult Server::submit(const std::string& url) {
    if (!work_) {
        return {false, "", SubmissionError::Unavailable, "server is not running"};
    }
    return work_->submit(url);
}

uint16_t Server::port() const noexcept {
    return http_ ? http_->port() : config_.port;
}

bool Server::createStorage() noexcept {
    try {
        std::filesystem::create_directories(config_.storage);
        LOG_DEBUG("Storage ready: " + config_.storage.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create storage: " + std::string(e.what()));
        return false;
    }
}

}
