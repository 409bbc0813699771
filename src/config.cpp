/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/config.hpp"
#include "tumbleup/logger.hpp"
#include <cstdlib>
#include <exception>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tumbleup {

namespace {
constexpr std::chrono::milliseconds kDefaultInterval{1000};
constexpr std::chrono::milliseconds kMinInterval{100};
}

Config Config::fromEnv() {
    Config config;

    if (const char* dir = std::getenv("TUMBLEUP_LOG_DIR"); dir && *dir) {
        config.logDir = dir;
    } else {
        std::error_code ec;
        config.logDir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            config.logDir = "/tmp";
        }
    }

    config.refreshInterval = parseInterval(std::getenv("TUMBLEUP_REFRESH_MS"));

    if (const char* diag = std::getenv("TUMBLEUP_DIAG_FILE"); diag && *diag) {
        config.diagFile = diag;
    }

    return config;
}

std::chrono::milliseconds Config::parseInterval(const char* value) noexcept {
    if (!value || !*value) {
        return kDefaultInterval;
    }
    try {
        std::size_t consumed = 0;
        long long ms = std::stoll(value, &consumed);
        if (value[consumed] != '\0' || ms < kMinInterval.count()) {
            LOG_WARN("Ignoring TUMBLEUP_REFRESH_MS=" + std::string(value));
            return kDefaultInterval;
        }
        return std::chrono::milliseconds(ms);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring TUMBLEUP_REFRESH_MS=" + std::string(value));
        return kDefaultInterval;
    }
}

RunContext RunContext::create(const Config& config) {
    RunContext ctx;
    ctx.config = config;
    ctx.runId = makeRunId(std::chrono::system_clock::now());
    ctx.logPath = config.logDir / (ctx.runId + "_os-update.log");
    LOG_DEBUG("Run " + ctx.runId + " logging to " + ctx.logPath.string());
    return ctx;
}

std::string RunContext::makeRunId(std::chrono::system_clock::time_point now) {
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d_%H-%M-%S");
    ss << "-" << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

}
