/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "tumbleup/types.hpp"

namespace tumbleup {

// Decides whether a conditional task has any work to do.
using Precheck = std::function<bool()>;

struct Task {
    TaskKey key;
    std::string label;
    std::string command;
    Precheck precheck; // empty: always run
};

// Fixed, ordered task sequence. Never grows or shrinks after construction.
class TaskList final {
public:
    explicit TaskList(std::vector<Task> tasks);

    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] const Task& at(std::size_t index) const { return tasks_.at(index); }
    [[nodiscard]] std::optional<std::size_t> indexOf(const TaskKey& key) const noexcept;

    [[nodiscard]] std::vector<Task>::const_iterator begin() const noexcept { return tasks_.begin(); }
    [[nodiscard]] std::vector<Task>::const_iterator end() const noexcept { return tasks_.end(); }

private:
    std::vector<Task> tasks_;
};

// refresh, update, dist_upgrade, remove_deps, update_flatpaks, remove_flatpaks
[[nodiscard]] TaskList defaultTasks(Precheck unneededPackages);

}
