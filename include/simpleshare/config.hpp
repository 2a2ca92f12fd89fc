/*
 * simpleshare - Media Conversion Job Service
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace simpleshare {

struct Config {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 5000;
    std::filesystem::path storage = "storage";
    std::string publicUrl;            // empty: http://localhost:<port>
    std::string fetcher = "yt-dlp";
    std::string transcoder = "ffmpeg";
    std::string outputExtension = "mp4";
    int workers = 8;

    // Reads PORT, PUBLIC_URL and SIMPLESHARE_* over the defaults.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] std::string publicBase() const;

    // Command lines reproducing the stock yt-dlp / ffmpeg invocations.
    [[nodiscard]] std::vector<std::string> fetcherArgs(const std::string& outputTemplate,
                                                       const std::string& url) const;
    [[nodiscard]] std::vector<std::string> transcoderArgs(const std::filesystem::path& input,
                                                          const std::filesystem::path& output) const;
};

// Loads KEY=VALUE lines into the environment without overriding
// variables that are already set. Returns the number of keys applied.
std::size_t loadEnvFile(const std::filesystem::path& path);

}
