/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "simpleshare/config.hpp"
#include "simpleshare/logger.hpp"
#include <cstdlib>
#include <fstream>

namespace simpleshare {

namespace {
std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    return val;
}

long env_long(const char* name, long defv, long minv, long maxv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long parsed = std::stol(val);
        if (parsed < minv || parsed > maxv) {
            LOG_WARN(std::string(name) + " out of range, using " + std::to_string(defv));
            return defv;
        }
        return parsed;
    } catch (...) {
        LOG_WARN(std::string(name) + " is not a number, using " + std::to_string(defv));
        return defv;
    }
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}
}

Config Config::fromEnv() {
    Config config;
    config.bindAddress = env_string("SIMPLESHARE_BIND", config.bindAddress);
    config.port = static_cast<uint16_t>(env_long("PORT", config.port, 1, 65535));
    config.storage = env_string("SIMPLESHARE_STORAGE", config.storage.string());
    config.publicUrl = env_string("PUBLIC_URL", config.publicUrl);
    config.fetcher = env_string("SIMPLESHARE_FETCHER", config.fetcher);
    config.transcoder = env_string("SIMPLESHARE_TRANSCODER", config.transcoder);
    config.workers = static_cast<int>(env_long("SIMPLESHARE_WORKERS", config.workers, 1, 256));
    return config;
}

std::string Config::publicBase() const {
    std::string base = publicUrl.empty() ? "http://localhost:" + std::to_string(port) : publicUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base;
}

std::vector<std::string> Config::fetcherArgs(const std::string& outputTemplate,
                                             const std::string& url) const {
    return {"-f", "bestvideo+bestaudio/best", "-o", outputTemplate, "--newline", url};
}

std::vector<std::string> Config::transcoderArgs(const std::filesystem::path& input,
                                                const std::filesystem::path& output) const {
    return {
        "-y", "-i", input.string(),
        "-c:v", "libx264", "-profile:v", "baseline", "-level", "3.0",
        "-pix_fmt", "yuv420p",
        "-c:a", "aac", "-b:a", "128k",
        "-movflags", "+faststart",
        "-vf", "scale='min(1280,iw)':'-2'",
        "-progress", "pipe:1",
        "-nostats",
        output.string()
    };
}

std::size_t loadEnvFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return 0;
    }

    std::size_t applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (std::getenv(key.c_str())) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++applied;
        }
    }
    LOG_DEBUG("Loaded " + std::to_string(applied) + " entries from " + path.string());
    return applied;
}

}
