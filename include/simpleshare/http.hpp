/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include "simpleshare/types.hpp"

namespace simpleshare {

class Work;
class Registry;
class Hub;

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Pulls the "url" field out of a JSON or form-encoded request body.
[[nodiscard]] std::optional<std::string> extractUrl(const std::string& contentType, const std::string& body);

// Decodes %XX escapes and '+' as space.
[[nodiscard]] std::string urlDecode(const std::string& text);

// Blocking HTTP/1.1 front end: one thread accepts, one thread per
// connection. Event streams hold their connection thread until the job
// terminates or the peer goes away.
class HttpListener final {
public:
    // Files under publicRoot are served read-only at /public/<name>.
    HttpListener(Work& work, const Registry& registry, Hub& hub,
                 std::string address, uint16_t port, std::filesystem::path publicRoot);
    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;
    HttpListener(HttpListener&&) = delete;
    HttpListener& operator=(HttpListener&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;

    // Bound port; differs from the requested one when that was 0.
    [[nodiscard]] uint16_t port() const noexcept { return boundPort_; }
    [[nodiscard]] std::size_t sessionCount() const noexcept;

    void setKeepAliveInterval(std::chrono::milliseconds interval) noexcept { keepAlive_ = interval; }

    // Request dispatch for everything except event streams.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);

private:
    void acceptLoop();
    void session(std::shared_ptr<boost::asio::ip::tcp::socket> socket, uint64_t sessionId);
    void stream(boost::asio::ip::tcp::socket& socket, const JobId& jobId, const HttpRequest& request);
    // Returns false when the connection must be closed.
    bool sendFile(boost::asio::ip::tcp::socket& socket, const std::string& name, const HttpRequest& request);

    HttpResponse submit(const HttpRequest& request);
    HttpResponse query(const HttpRequest& request, const JobId& jobId);

    Work& work_;
    const Registry& registry_;
    Hub& hub_;
    std::string address_;
    uint16_t requestedPort_;
    std::filesystem::path publicRoot_;
    uint16_t boundPort_ = 0;
    std::chrono::milliseconds keepAlive_{15000};

    boost::asio::io_context ioc_{1};
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::thread acceptThread_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessionsMutex_;
    std::condition_variable sessionsDone_;
    std::unordered_map<uint64_t, std::shared_ptr<boost::asio::ip::tcp::socket>> sessions_;
    uint64_t nextSessionId_ = 0;
};

}
