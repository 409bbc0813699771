/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/updater.hpp"
#include "tumbleup/executor.hpp"
#include "tumbleup/log_sink.hpp"
#include "tumbleup/logger.hpp"
#include "tumbleup/refresher.hpp"
#include "tumbleup/renderer.hpp"
#include "tumbleup/status_board.hpp"
#include "tumbleup/task_runner.hpp"
#include "tumbleup/terminal.hpp"

namespace tumbleup {

Updater::Updater(const RunContext& context, std::ostream& out)
    : Updater(context, out, std::make_unique<ShellExecutor>(), std::make_unique<TtyMetrics>()) {
}

Updater::Updater(const RunContext& context, std::ostream& out,
                 std::unique_ptr<CommandExecutor> executor, std::unique_ptr<TerminalMetrics> terminal)
    : context_(context), out_(out), executor_(std::move(executor)), terminal_(std::move(terminal)) {
    tasks_ = std::make_unique<TaskList>(defaultTasks(unneededPackagesCheck(*executor_)));
    board_ = std::make_unique<StatusBoard>(*tasks_);
    sink_ = std::make_unique<LogSink>(context_.logPath);
    renderer_ = std::make_unique<SummaryRenderer>(*board_, *sink_, *terminal_, out_);
    runner_ = std::make_unique<TaskRunner>(*tasks_, *board_, *sink_, *executor_,
                                           [this]() { renderer_->render(); });
    refresher_ = std::make_unique<Refresher>(context_.config.refreshInterval);
    diagnostics_ = postRunDiagnostics(*executor_);

    LOG_DEBUG("Updater created - run: " + context_.runId + ", log: " + context_.logPath.string());
}

Updater::~Updater() {
    if (refresher_) {
        refresher_->stop();
    }
}

int Updater::run() {
    setThreadName("Main");
    LOG_INFO("Starting update run " + context_.runId);

    if (!refresher_->start([this]() { renderer_->render(); })) {
        LOG_WARN("Periodic refresh unavailable; dashboard updates on status changes only");
    }

    RunOutcome outcome = runner_->run();
    refresher_->stop();
    renderer_->render();

    if (outcome) {
        out_ << diagnostics_();
        printLogLocation(false);
        LOG_INFO("Update run " + context_.runId + " finished");
        return 0;
    }

    // Diagnostics are pointless when not even the repositories refreshed
    if (outcome.failedIndex && *outcome.failedIndex != 0) {
        out_ << diagnostics_();
    }
    printLogLocation(true);
    LOG_ERROR("Update run " + context_.runId + " failed");
    return 1;
}

void Updater::printLogLocation(bool failed) {
    const std::string dir = context_.logPath.parent_path().string();
    out_ << "\n\n\n";
    if (failed) {
        out_ << "If you want to view the log or keep it, please move it from " << dir << "\n";
        out_ << "Log: " << context_.logPath.string() << "\n";
    } else {
        out_ << "Note: If you want to view the log\n";
        out_ << "Log: " << context_.logPath.string() << "\n";
        out_ << "If you want to keep it, make sure you move it from " << dir << " before a reboot.\n";
    }
    out_ << std::flush;
}

}
