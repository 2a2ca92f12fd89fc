/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/http.hpp"
#include "simpleshare/event.hpp"
#include "simpleshare/hub.hpp"
#include "simpleshare/logger.hpp"
#include "simpleshare/registry.hpp"
#include "simpleshare/work.hpp"
#include <cctype>
#include <tuple>
#include <system_error>

#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <nlohmann/json.hpp>

#include <sys/socket.h>

namespace simpleshare {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr std::size_t kMaxBodyBytes = 64 * 1024;
constexpr auto kPollSlice = std::chrono::milliseconds(500);

template <typename View>
std::string toStdString(const View& view) {
    return std::string(view.data(), view.size());
}

std::string targetPath(const HttpRequest& request) {
    std::string target = toStdString(request.target());
    auto query = target.find('?');
    if (query != std::string::npos) {
        target.erase(query);
    }
    return target;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string toLowerCopy(std::string value) {
    for (char& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

HttpResponse jsonResponse(http::status status, const nlohmann::json& body, const HttpRequest& request) {
    HttpResponse res{status, request.version()};
    res.set(http::field::server, "simpleshare");
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(request.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

HttpResponse errorResponse(http::status status, const std::string& message, const HttpRequest& request) {
    return jsonResponse(status, nlohmann::json{{"error", message}}, request);
}

bool isStreamRequest(const HttpRequest& request) {
    return request.method() == http::verb::get && startsWith(targetPath(request), "/status/");
}

bool isFileRequest(const HttpRequest& request) {
    return (request.method() == http::verb::get || request.method() == http::verb::head) &&
           startsWith(targetPath(request), "/public/");
}

// Single path component only: no separators, no dot-dot, no hidden files.
bool isSafeFileName(const std::string& name) {
    return !name.empty() && name[0] != '.' &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

const char* mimeType(const std::filesystem::path& path) {
    std::string ext = toLowerCopy(path.extension().string());
    if (ext == ".mp4" || ext == ".m4v") return "video/mp4";
    if (ext == ".webm") return "video/webm";
    if (ext == ".mkv") return "video/x-matroska";
    if (ext == ".m4a") return "audio/mp4";
    if (ext == ".mp3") return "audio/mpeg";
    return "application/octet-stream";
}

void shutdownNative(int fd) noexcept {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}
}

std::string urlDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::optional<std::string> extractUrl(const std::string& contentType, const std::string& body) {
    std::string type = toLowerCopy(contentType);
    bool json = type.find("application/json") != std::string::npos;
    bool form = type.find("application/x-www-form-urlencoded") != std::string::npos;
    if (!json && !form) {
        auto first = body.find_first_not_of(" \t\r\n");
        json = first != std::string::npos && body[first] == '{';
        form = !json;
    }

    if (json) {
        auto parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return std::nullopt;
        }
        auto it = parsed.find("url");
        if (it == parsed.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::size_t start = 0;
    while (start <= body.size()) {
        auto end = body.find('&', start);
        if (end == std::string::npos) {
            end = body.size();
        }
        std::string pair = body.substr(start, end - start);
        auto eq = pair.find('=');
        if (eq != std::string::npos && urlDecode(pair.substr(0, eq)) == "url") {
            return urlDecode(pair.substr(eq + 1));
        }
        start = end + 1;
    }
    return std::nullopt;
}

HttpListener::HttpListener(Work& work, const Registry& registry, Hub& hub,
                           std::string address, uint16_t port, std::filesystem::path publicRoot)
    : work_(work), registry_(registry), hub_(hub),
      address_(std::move(address)), requestedPort_(port), publicRoot_(std::move(publicRoot)) {
    LOG_DEBUG("HttpListener created for " + address_ + ":" + std::to_string(port));
}

HttpListener::~HttpListener() {
    stop();
}

bool HttpListener::start() {
    if (running_.load()) {
        LOG_WARN("HttpListener already running");
        return false;
    }

    try {
        tcp::endpoint endpoint{net::ip::make_address(address_), requestedPort_};
        acceptor_ = std::make_unique<tcp::acceptor>(ioc_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(net::socket_base::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(net::socket_base::max_listen_connections);
        boundPort_ = acceptor_->local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to listen on " + address_ + ":" + std::to_string(requestedPort_) + ": " + e.what());
        acceptor_.reset();
        return false;
    }

    running_.store(true);
    acceptThread_ = std::thread(&HttpListener::acceptLoop, this);
    LOG_INFO("Listening on http://" + address_ + ":" + std::to_string(boundPort_));
    return true;
}

void HttpListener::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping HttpListener...");

    // Wakes the blocking accept()
    shutdownNative(acceptor_->native_handle());
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    boost::system::error_code ec;
    acceptor_->close(ec);

    std::size_t open = sessionCount();
    if (open > 0) {
        LOG_INFO("Closing " + std::to_string(open) + " open connection(s)");
    }

    std::unique_lock<std::mutex> lock(sessionsMutex_);
    for (auto& entry : sessions_) {
        shutdownNative(entry.second->native_handle());
    }
    sessionsDone_.wait(lock, [this] { return sessions_.empty(); });

    LOG_INFO("HttpListener stopped");
}

std::size_t HttpListener::sessionCount() const noexcept {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

void HttpListener::acceptLoop() {
    setThreadName("Http");
    LOG_DEBUG("Accept loop started");

    while (running_.load()) {
        auto socket = std::make_shared<tcp::socket>(ioc_);
        boost::system::error_code ec;
        acceptor_->accept(*socket, ec);
        if (ec) {
            if (!running_.load()) {
                break;
            }
            LOG_WARN("Accept failed: " + ec.message());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        uint64_t sessionId = 0;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            sessionId = ++nextSessionId_;
            sessions_.emplace(sessionId, socket);
        }

        try {
            std::thread(&HttpListener::session, this, socket, sessionId).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Failed to start session thread: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            sessions_.erase(sessionId);
            sessionsDone_.notify_all();
        }
    }

    LOG_DEBUG("Accept loop stopped");
}

void HttpListener::session(std::shared_ptr<tcp::socket> socket, uint64_t sessionId) {
    setThreadName("Session-" + std::to_string(sessionId));

    try {
        beast::flat_buffer buffer;
        while (running_.load()) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(kMaxBodyBytes);

            boost::system::error_code ec;
            http::read(*socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                LOG_DEBUG("Read failed: " + ec.message());
                break;
            }

            HttpRequest request = parser.release();
            LOG_DEBUG(toStdString(request.method_string()) + " " + toStdString(request.target()));

            if (isStreamRequest(request)) {
                stream(*socket, targetPath(request).substr(std::string("/status/").size()), request);
                break;
            }

            if (isFileRequest(request)) {
                std::string name = urlDecode(targetPath(request).substr(std::string("/public/").size()));
                if (!sendFile(*socket, name, request)) {
                    break;
                }
                continue;
            }

            HttpResponse response = handle(request);
            bool keepAlive = response.keep_alive();
            http::write(*socket, response, ec);
            if (ec || !keepAlive) {
                break;
            }
        }

        boost::system::error_code ec;
        socket->shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& e) {
        LOG_WARN("Session error: " + std::string(e.what()));
    }

    boost::system::error_code ec;
    socket->close(ec);

    // The socket must be gone before stop() can return
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_.erase(sessionId);
    socket.reset();
    sessionsDone_.notify_all();
}

void HttpListener::stream(tcp::socket& socket, const JobId& jobId, const HttpRequest& request) {
    boost::system::error_code ec;

    auto subscriber = std::make_shared<Subscriber>();
    if (hub_.attach(jobId, subscriber) != AttachResult::Attached) {
        auto response = errorResponse(http::status::not_found, "job not found", request);
        response.keep_alive(false);
        http::write(socket, response, ec);
        return;
    }

    http::response<http::empty_body> header{http::status::ok, request.version()};
    header.set(http::field::server, "simpleshare");
    header.set(http::field::content_type, "text/event-stream");
    header.set(http::field::cache_control, "no-cache");
    header.set(http::field::connection, "keep-alive");
    http::response_serializer<http::empty_body> serializer{header};
    http::write_header(socket, serializer, ec);
    if (ec) {
        hub_.detach(jobId, subscriber);
        return;
    }
    LOG_DEBUG("Event stream opened for " + jobId);

    auto silence = std::chrono::milliseconds(0);
    bool terminal = false;
    while (running_.load() && !terminal) {
        auto event = subscriber->next(kPollSlice);
        std::string frame;
        if (event) {
            frame = formatSse(*event);
            terminal = isTerminal(event->snapshot.status);
            silence = std::chrono::milliseconds(0);
        } else {
            if (subscriber->closed()) {
                break;
            }
            silence += kPollSlice;
            if (silence < keepAlive_) {
                continue;
            }
            frame = ": keep-alive\n\n";
            silence = std::chrono::milliseconds(0);
        }

        net::write(socket, net::buffer(frame), ec);
        if (ec) {
            LOG_DEBUG("Subscriber for " + jobId + " went away: " + ec.message());
            break;
        }
    }

    hub_.detach(jobId, subscriber);
    subscriber->close();
    LOG_DEBUG("Event stream closed for " + jobId);
}

bool HttpListener::sendFile(tcp::socket& socket, const std::string& name, const HttpRequest& request) {
    boost::system::error_code ec;

    std::filesystem::path path = publicRoot_ / name;
    std::error_code fsError;
    if (!isSafeFileName(name) || !std::filesystem::is_regular_file(path, fsError)) {
        auto response = errorResponse(http::status::not_found, "not found", request);
        http::write(socket, response, ec);
        return !ec && response.keep_alive();
    }

    http::file_body::value_type file;
    file.open(path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        LOG_WARN("Cannot open " + path.string() + ": " + ec.message());
        auto response = errorResponse(http::status::not_found, "not found", request);
        http::write(socket, response, ec);
        return false;
    }
    auto size = file.size();

    if (request.method() == http::verb::head) {
        http::response<http::empty_body> response{http::status::ok, request.version()};
        response.set(http::field::server, "simpleshare");
        response.set(http::field::content_type, mimeType(path));
        response.content_length(size);
        response.keep_alive(request.keep_alive());
        http::write(socket, response, ec);
        return !ec && request.keep_alive();
    }

    http::response<http::file_body> response{
        std::piecewise_construct,
        std::make_tuple(std::move(file)),
        std::make_tuple(http::status::ok, request.version())};
    response.set(http::field::server, "simpleshare");
    response.set(http::field::content_type, mimeType(path));
    response.content_length(size);
    response.keep_alive(request.keep_alive());
    http::write(socket, response, ec);
    if (ec) {
        LOG_DEBUG("File transfer of " + name + " aborted: " + ec.message());
        return false;
    }
    LOG_DEBUG("Served " + name + " (" + std::to_string(size) + " bytes)");
    return request.keep_alive();
}

HttpResponse HttpListener::handle(const HttpRequest& request) {
    std::string path = targetPath(request);

    try {
        if (path == "/health") {
            if (request.method() != http::verb::get) {
                return errorResponse(http::status::method_not_allowed, "method not allowed", request);
            }
            return jsonResponse(http::status::ok, nlohmann::json{{"ok", true}}, request);
        }

        if (path == "/convert") {
            if (request.method() != http::verb::post) {
                return errorResponse(http::status::method_not_allowed, "method not allowed", request);
            }
            return submit(request);
        }

        for (const char* prefix : {"/jobs/", "/status/"}) {
            if (startsWith(path, prefix)) {
                if (request.method() != http::verb::get) {
                    return errorResponse(http::status::method_not_allowed, "method not allowed", request);
                }
                return query(request, path.substr(std::string(prefix).size()));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Request handling failed for " + path + ": " + e.what());
        return errorResponse(http::status::internal_server_error, "internal error", request);
    }

    return errorResponse(http::status::not_found, "not found", request);
}

HttpResponse HttpListener::submit(const HttpRequest& request) {
    std::string contentType = toStdString(request[http::field::content_type]);
    auto url = extractUrl(contentType, request.body());

    SubmitResult result = work_.submit(url.value_or(""));
    if (!result) {
        if (result.error == SubmissionError::InvalidUrl) {
            return errorResponse(http::status::bad_request, result.message, request);
        }
        return errorResponse(http::status::service_unavailable, result.message, request);
    }

    std::string host = toStdString(request[http::field::host]);
    if (host.empty()) {
        host = "localhost:" + std::to_string(boundPort_);
    }

    nlohmann::json body{
        {"jobId", result.id},
        {"statusUrl", "http://" + host + "/status/" + result.id}
    };
    return jsonResponse(http::status::ok, body, request);
}

HttpResponse HttpListener::query(const HttpRequest& request, const JobId& jobId) {
    auto snapshot = registry_.snapshot(jobId);
    if (!snapshot) {
        return errorResponse(http::status::not_found, "job not found", request);
    }
    return jsonResponse(http::status::ok, toJson(*snapshot), request);
}

}
