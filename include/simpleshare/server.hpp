/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "simpleshare/config.hpp"
#include "simpleshare/hub.hpp"
#include "simpleshare/registry.hpp"
#include "simpleshare/work.hpp"

namespace simpleshare {

class Pool;
class Processor;
class HttpListener;

// Owns the job engine and its HTTP front end.
class Server final {
public:
    explicit Server(Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] SubmitResult submit(const std::string& url);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Registry& registry() noexcept { return registry_; }
    [[nodiscard]] Hub& hub() noexcept { return hub_; }

private:
    [[nodiscard]] bool createStorage() noexcept;

    Config config_;
    Registry registry_;
    Hub hub_;

    std::atomic<bool> running_{false};

    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Work> work_;
    std::unique_ptr<HttpListener> http_;
};

}
