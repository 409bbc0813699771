/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <ostream>

#include "tumbleup/config.hpp"
#include "tumbleup/maintenance.hpp"
#include "tumbleup/task.hpp"

namespace tumbleup {

class CommandExecutor;
class TerminalMetrics;
class StatusBoard;
class LogSink;
class SummaryRenderer;
class TaskRunner;
class Refresher;

// One full update run: the task sequence, the live dashboard and the
// closing report.
class Updater final {
public:
    Updater(const RunContext& context, std::ostream& out);
    Updater(const RunContext& context, std::ostream& out,
            std::unique_ptr<CommandExecutor> executor, std::unique_ptr<TerminalMetrics> terminal);
    ~Updater();

    Updater(const Updater&) = delete;
    Updater& operator=(const Updater&) = delete;
    Updater(Updater&&) = delete;
    Updater& operator=(Updater&&) = delete;

    // Process exit code: 0 when every task completed, 1 otherwise.
    [[nodiscard]] int run();

    [[nodiscard]] const StatusBoard& board() const noexcept { return *board_; }
    [[nodiscard]] const LogSink& sink() const noexcept { return *sink_; }
    [[nodiscard]] const TaskList& tasks() const noexcept { return *tasks_; }

private:
    void printLogLocation(bool failed);

    RunContext context_;
    std::ostream& out_;

    std::unique_ptr<CommandExecutor> executor_;
    std::unique_ptr<TerminalMetrics> terminal_;
    std::unique_ptr<TaskList> tasks_;
    std::unique_ptr<StatusBoard> board_;
    std::unique_ptr<LogSink> sink_;
    std::unique_ptr<SummaryRenderer> renderer_;
    std::unique_ptr<TaskRunner> runner_;
    std::unique_ptr<Refresher> refresher_;
    Diagnostics diagnostics_;
};

}
