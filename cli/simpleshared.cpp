/*
 * simpleshare - Server daemon (simpleshared)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/config.hpp"
#include "simpleshare/logger.hpp"
#include "simpleshare/server.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

using namespace simpleshare;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "simpleshare daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --bind <address>      Listen address (default 0.0.0.0)\n";
    std::cout << "  -p, --port <n>        Listen port (default 5000)\n";
    std::cout << "  -s, --storage <dir>   Directory for downloads and outputs (default ./storage)\n";
    std::cout << "  --public-url <url>    Base URL of the published files\n";
    std::cout << "  --fetcher <program>   Fetcher executable (default yt-dlp)\n";
    std::cout << "  --transcoder <prog>   Transcoder executable (default ffmpeg)\n";
    std::cout << "  -w, --workers <n>     Concurrent jobs (default 8)\n";
    std::cout << "  --log-level <level>   ERROR, WARN, INFO, DEBUG, TRACE\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables (also read from ./.env):\n";
    std::cout << "  PORT, PUBLIC_URL, SIMPLESHARE_BIND, SIMPLESHARE_STORAGE,\n";
    std::cout << "  SIMPLESHARE_FETCHER, SIMPLESHARE_TRANSCODER, SIMPLESHARE_WORKERS,\n";
    std::cout << "  SIMPLESHARE_LOG_LEVEL\n\n";
    std::cout << "Endpoints:\n";
    std::cout << "  POST /convert         {\"url\": \"...\"} -> {\"jobId\", \"statusUrl\"}\n";
    std::cout << "  GET  /status/<id>     Server-Sent Events progress stream\n";
    std::cout << "  GET  /jobs/<id>       Current job state\n";
    std::cout << "  GET  /health\n";
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    loadEnvFile(std::filesystem::current_path() / ".env");
    Logger::initFromEnv();
    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        try {
            if (arg == "--bind" && hasValue) {
                config.bindAddress = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && hasValue) {
                int port = std::stoi(argv[++i]);
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: Invalid port\n";
                    return 1;
                }
                config.port = static_cast<uint16_t>(port);
            } else if ((arg == "-s" || arg == "--storage") && hasValue) {
                config.storage = argv[++i];
            } else if (arg == "--public-url" && hasValue) {
                config.publicUrl = argv[++i];
            } else if (arg == "--fetcher" && hasValue) {
                config.fetcher = argv[++i];
            } else if (arg == "--transcoder" && hasValue) {
                config.transcoder = argv[++i];
            } else if ((arg == "-w" || arg == "--workers") && hasValue) {
                config.workers = std::stoi(argv[++i]);
                if (config.workers < 1) {
                    std::cerr << "Error: Invalid worker count\n";
                    return 1;
                }
            } else if (arg == "--log-level" && hasValue) {
                LogLevel level = LogLevel::INFO;
                if (!Logger::parseLevel(argv[++i], level)) {
                    std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
                    return 1;
                }
                Logger::setLevel(level);
            } else {
                std::cerr << "Error: Unknown or incomplete option: " << arg << "\n\n";
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid value for " << arg << "\n";
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Server server(config);
        if (!server.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "  \033[1msimpleshare\033[0m " << VERSION << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Listen     http://" << config.bindAddress << ":" << server.port() << "\n";
        std::cout << "    Public     " << config.publicBase() << "/public/\n";
        std::cout << "    Storage    " << config.storage.string() << "\n";
        std::cout << "    Workers    " << config.workers << "\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    } catch (...) {
        LOG_ERROR("Unknown server error");
        return 1;
    }

    LOG_DEBUG("simpleshare daemon stopped");
    return 0;
}
