/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <optional>

#include "tumbleup/task.hpp"
#include "tumbleup/types.hpp"

namespace tumbleup {

class StatusBoard;
class LogSink;
class CommandExecutor;

struct RunOutcome {
    bool ok = false;
    std::optional<std::size_t> failedIndex;
    explicit operator bool() const noexcept { return ok; }
};

// Executes the fixed task list strictly in order. The first nonzero exit
// code marks that task Failed, every later task Skipped, and ends the run.
class TaskRunner final {
public:
    TaskRunner(const TaskList& tasks, StatusBoard& board, LogSink& sink,
               CommandExecutor& executor, std::function<void()> onTransition = {});

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;
    TaskRunner(TaskRunner&&) = delete;
    TaskRunner& operator=(TaskRunner&&) = delete;

    [[nodiscard]] RunOutcome run();

    // Runs one task; false on failure, after the cascade has been applied.
    [[nodiscard]] bool runTask(std::size_t index);

    // Marks every task after failedIndex as Skipped.
    void cascadeSkip(std::size_t failedIndex);

private:
    [[nodiscard]] bool transition(std::size_t index, Status next);
    void notify();

    const TaskList& tasks_;
    StatusBoard& board_;
    LogSink& sink_;
    CommandExecutor& executor_;
    std::function<void()> onTransition_;
};

}
