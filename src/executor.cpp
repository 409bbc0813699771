/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/executor.hpp"
#include "tumbleup/log_sink.hpp"
#include "tumbleup/logger.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tumbleup {

namespace {
std::string errnoMessage() {
    return std::strerror(errno);
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG_ERROR("waitpid failed: " + errnoMessage());
            return ShellExecutor::kSpawnFailure;
        }
    }
    return ShellExecutor::decodeWaitStatus(status);
}
}

int ShellExecutor::execute(const std::string& command, LogSink& sink) {
    LOG_DEBUG("Executing: " + command);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        LOG_ERROR("Failed to create pipe: " + errnoMessage());
        return kSpawnFailure;
    }

    pid_t pid = fork();
    if (pid == -1) {
        LOG_ERROR("Failed to fork: " + errnoMessage());
        close(pipefd[0]);
        close(pipefd[1]);
        return kSpawnFailure;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(kSpawnFailure);
    }

    close(pipefd[1]);

    std::array<char, 4096> buf;
    bool sinkHealthy = true;
    for (;;) {
        ssize_t n = read(pipefd[0], buf.data(), buf.size());
        if (n > 0) {
            // Keep draining after a sink failure so the child never blocks
            if (sinkHealthy && !sink.append(std::string_view(buf.data(), static_cast<std::size_t>(n)))) {
                LOG_WARN("Command output is no longer being logged: " + command);
                sinkHealthy = false;
            }
            continue;
        }
        if (n == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        LOG_ERROR("Failed to read command output: " + errnoMessage());
        break;
    }
    close(pipefd[0]);

    int exitCode = waitForChild(pid);
    LOG_DEBUG("Command exited with " + std::to_string(exitCode) + ": " + command);
    return exitCode;
}

CaptureResult ShellExecutor::capture(const std::string& command) {
    CaptureResult result;
    LOG_DEBUG("Capturing: " + command);

    // Subshell so stderr of every command in a list is collected
    FILE* pipe = popen(("(" + command + "\n) 2>&1").c_str(), "r");
    if (!pipe) {
        result.error = "Failed to start '" + command + "': " + errnoMessage();
        LOG_ERROR(result.error);
        return result;
    }

    std::array<char, 4096> buf;
    std::size_t n = 0;
    while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) {
        result.output.append(buf.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.error = "Failed to collect '" + command + "': " + errnoMessage();
        LOG_ERROR(result.error);
        return result;
    }

    result.exitCode = decodeWaitStatus(status);
    result.ok = result.exitCode == 0;
    if (!result.ok) {
        result.error = "'" + command + "' exited with " + std::to_string(result.exitCode);
    }
    return result;
}

int ShellExecutor::decodeWaitStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return kSpawnFailure;
}

}
