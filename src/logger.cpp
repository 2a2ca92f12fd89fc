/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace simpleshare {

namespace {
std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::INFO)};
std::once_flag g_env_once;
std::mutex g_write_mutex;

thread_local std::string t_thread_name;
thread_local std::string t_job_id;

LogLevel envLevel() noexcept {
    const char* env_val = std::getenv("SIMPLESHARE_LOG_LEVEL");
    LogLevel parsed = LogLevel::INFO;
    if (env_val && Logger::parseLevel(env_val, parsed)) {
        return parsed;
    }
    return LogLevel::INFO;
}

// Picks up the environment once unless setLevel() got there first.
void ensureInitialized() noexcept {
    try {
        std::call_once(g_env_once, [] { g_level.store(static_cast<uint8_t>(envLevel())); });
    } catch (const std::system_error&) {
        // level stays at INFO
    }
}
}

void Logger::setLevel(LogLevel level) noexcept {
    ensureInitialized();
    g_level.store(static_cast<uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    ensureInitialized();
    g_level.store(static_cast<uint8_t>(envLevel()));
}

LogLevel Logger::level() noexcept {
    ensureInitialized();
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) noexcept {
    std::string level_str(text);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") { out = LogLevel::ERROR; return true; }
    if (level_str == "warn" || level_str == "warning") { out = LogLevel::WARN; return true; }
    if (level_str == "info") { out = LogLevel::INFO; return true; }
    if (level_str == "debug") { out = LogLevel::DEBUG; return true; }
    if (level_str == "trace") { out = LogLevel::TRACE; return true; }
    return false;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << levelToString(level) << "] [";
        if (t_thread_name.empty()) {
            line << "T" << std::this_thread::get_id();
        } else {
            line << t_thread_name;
        }
        if (!t_job_id.empty()) {
            line << " job=" << t_job_id;
        }
        line << "] " << message << "\n";

        // stdout carries the daemon banner and job status lines
        std::lock_guard<std::mutex> lock(g_write_mutex);
        std::cerr << line.str() << std::flush;
    } catch (...) {
        // Never throw from logging
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "UNKN ";
}

JobLogScope::JobLogScope(const std::string& jobId) : previous_(t_job_id) {
    t_job_id = jobId;
}

JobLogScope::~JobLogScope() {
    t_job_id.swap(previous_);
}

void setThreadName(const std::string& name) {
    t_thread_name = name;
}

const std::string& currentThreadName() noexcept {
    return t_thread_name;
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

}
