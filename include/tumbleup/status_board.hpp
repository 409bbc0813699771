/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "tumbleup/task.hpp"
#include "tumbleup/types.hpp"

namespace tumbleup {

// Invoked after every write, outside the board lock.
using ChangeListener = std::function<void(std::size_t index, Status previous, Status next)>;

// Current status of every task. Written by the task runner, read by the
// runner and the renderer. Each value is read and written under one mutex,
// so a reader never sees a torn status; a snapshot across keys is taken
// under the same lock but carries no meaning beyond that instant.
class StatusBoard final {
public:
    explicit StatusBoard(const TaskList& tasks);

    StatusBoard(const StatusBoard&) = delete;
    StatusBoard& operator=(const StatusBoard&) = delete;
    StatusBoard(StatusBoard&&) = delete;
    StatusBoard& operator=(StatusBoard&&) = delete;

    [[nodiscard]] bool set(const TaskKey& key, Status status);
    [[nodiscard]] bool setAt(std::size_t index, Status status);

    [[nodiscard]] std::optional<Status> get(const TaskKey& key) const;
    [[nodiscard]] std::optional<Status> getAt(std::size_t index) const;
    [[nodiscard]] std::vector<Status> snapshot() const;

    [[nodiscard]] const TaskList& tasks() const noexcept { return tasks_; }
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }

    void setListener(ChangeListener listener);

private:
    const TaskList& tasks_;
    mutable std::mutex mutex_;
    std::vector<Status> statuses_;
    ChangeListener listener_;
};

}
