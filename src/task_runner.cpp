/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/task_runner.hpp"
#include "tumbleup/executor.hpp"
#include "tumbleup/log_sink.hpp"
#include "tumbleup/logger.hpp"
#include "tumbleup/status_board.hpp"
#include <chrono>
#include <exception>

namespace tumbleup {

TaskRunner::TaskRunner(const TaskList& tasks, StatusBoard& board, LogSink& sink,
                       CommandExecutor& executor, std::function<void()> onTransition)
    : tasks_(tasks), board_(board), sink_(sink), executor_(executor),
      onTransition_(std::move(onTransition)) {
}

RunOutcome TaskRunner::run() {
    RunOutcome outcome;
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
        if (!runTask(i)) {
            outcome.failedIndex = i;
            LOG_WARN("Run stopped at task " + tasks_.at(i).key);
            return outcome;
        }
    }
    outcome.ok = true;
    LOG_INFO("All " + std::to_string(tasks_.size()) + " tasks completed");
    return outcome;
}

bool TaskRunner::runTask(std::size_t index) {
    const Task& task = tasks_.at(index);

    auto current = board_.getAt(index);
    if (!current || *current != Status::Pending) {
        LOG_ERROR("Task " + task.key + " is not pending; refusing to run it");
        return false;
    }

    if (task.precheck && !task.precheck()) {
        LOG_INFO("Nothing to do for " + task.key);
        bool recorded = transition(index, Status::Completed);
        notify();
        return recorded;
    }

    if (!transition(index, Status::Running)) {
        return false;
    }
    notify();

    LOG_INFO("Running " + task.key + ": " + task.command);
    auto startTime = std::chrono::steady_clock::now();
    int exitCode = executor_.execute(task.command, sink_);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    if (exitCode == 0) {
        LOG_INFO(task.key + " completed in " + std::to_string(elapsed) + "s");
        bool recorded = transition(index, Status::Completed);
        notify();
        return recorded;
    }

    LOG_ERROR(task.key + " failed with exit code " + std::to_string(exitCode) +
              " after " + std::to_string(elapsed) + "s");
    (void)transition(index, Status::Failed);
    cascadeSkip(index);
    notify();
    return false;
}

void TaskRunner::cascadeSkip(std::size_t failedIndex) {
    for (std::size_t i = failedIndex + 1; i < tasks_.size(); ++i) {
        (void)transition(i, Status::Skipped);
    }
}

bool TaskRunner::transition(std::size_t index, Status next) {
    auto current = board_.getAt(index);
    if (!current) {
        return false;
    }
    if (!isLegalTransition(*current, next)) {
        LOG_WARN("Ignoring transition of " + tasks_.at(index).key + " from " +
                 statusLabel(*current) + "to " + statusLabel(next));
        return false;
    }
    return board_.setAt(index, next);
}

void TaskRunner::notify() {
    if (!onTransition_) {
        return;
    }
    try {
        onTransition_();
    } catch (const std::exception& e) {
        LOG_ERROR("Render after transition failed: " + std::string(e.what()));
    }
}

}
