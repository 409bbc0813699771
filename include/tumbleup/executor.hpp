/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

namespace tumbleup {

class LogSink;

struct CaptureResult {
    bool ok = false;
    int exitCode = -1;
    std::string output;
    std::string error;
};

// Runs opaque shell command strings. Blocks until the command exits.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    // Streams combined stdout/stderr into sink as it is produced and
    // returns the exit code; zero is the only success.
    [[nodiscard]] virtual int execute(const std::string& command, LogSink& sink) = 0;

    // Combined stdout/stderr collected into a string.
    [[nodiscard]] virtual CaptureResult capture(const std::string& command) = 0;
};

class ShellExecutor final : public CommandExecutor {
public:
    // Reported when the child could not be started at all.
    static constexpr int kSpawnFailure = 127;

    [[nodiscard]] int execute(const std::string& command, LogSink& sink) override;
    [[nodiscard]] CaptureResult capture(const std::string& command) override;

    // WEXITSTATUS for a normal exit, 128 + signal for a killed child.
    [[nodiscard]] static int decodeWaitStatus(int status) noexcept;
};

}
