/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace tumbleup {

// Layout thresholds for the dashboard.
inline constexpr int MIN_HEIGHT = 11;
inline constexpr int MIN_WIDTH = 45;
inline constexpr int LOG_MIN_CHARACTERS = 300;

struct Config {
    std::filesystem::path logDir;
    std::chrono::milliseconds refreshInterval{1000};
    std::filesystem::path diagFile;

    // TUMBLEUP_LOG_DIR, TUMBLEUP_REFRESH_MS, TUMBLEUP_DIAG_FILE
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] static std::chrono::milliseconds parseInterval(const char* value) noexcept;
};

// Created once at startup and handed to every component that needs the
// run identity or the log location.
struct RunContext {
    std::string runId;
    std::filesystem::path logPath;
    Config config;

    [[nodiscard]] static RunContext create(const Config& config);
    [[nodiscard]] static std::string makeRunId(std::chrono::system_clock::time_point now);
};

}
