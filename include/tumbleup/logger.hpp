/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace tumbleup {

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
    [[nodiscard]] static LogLevel level() noexcept;

    // Diagnostics go to stderr unless redirected here. The dashboard owns
    // the terminal, so the CLI points this at a file when asked to.
    [[nodiscard]] static bool setOutputFile(const std::filesystem::path& path) noexcept;
    static void resetOutput() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& value, LogLevel fallback) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::tumbleup::Logger::error(msg)
#define LOG_WARN(msg)  ::tumbleup::Logger::warn(msg)
#define LOG_INFO(msg)  ::tumbleup::Logger::info(msg)
#define LOG_DEBUG(msg) ::tumbleup::Logger::debug(msg)
#define LOG_TRACE(msg) ::tumbleup::Logger::trace(msg)
