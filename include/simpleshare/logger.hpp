/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace simpleshare {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // Applies SIMPLESHARE_LOG_LEVEL; unset or unknown values mean INFO.
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;
    [[nodiscard]] static bool parseLevel(const std::string& text, LogLevel& out) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static const char* levelToString(LogLevel level) noexcept;
};

// Tags every line logged by the current thread with a job id until
// the scope ends. Scopes nest; the previous tag is restored.
class JobLogScope {
public:
    explicit JobLogScope(const std::string& jobId);
    ~JobLogScope();

    JobLogScope(const JobLogScope&) = delete;
    JobLogScope& operator=(const JobLogScope&) = delete;

private:
    std::string previous_;
};

// Thread naming for log context. Names live with the thread.
void setThreadName(const std::string& name);
[[nodiscard]] const std::string& currentThreadName() noexcept;
[[nodiscard]] std::string getThreadName(int worker_id);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::simpleshare::Logger::error(msg)
#define LOG_WARN(msg)  ::simpleshare::Logger::warn(msg)  
#define LOG_INFO(msg)  ::simpleshare::Logger::info(msg)
#define LOG_DEBUG(msg) ::simpleshare::Logger::debug(msg)
#define LOG_TRACE(msg) ::simpleshare::Logger::trace(msg)
