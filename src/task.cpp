/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/task.hpp"
#include <stdexcept>
#include <unordered_set>

namespace tumbleup {

TaskList::TaskList(std::vector<Task> tasks) : tasks_(std::move(tasks)) {
    std::unordered_set<TaskKey> seen;
    for (const auto& task : tasks_) {
        if (task.key.empty()) {
            throw std::invalid_argument("task key must not be empty");
        }
        if (!seen.insert(task.key).second) {
            throw std::invalid_argument("duplicate task key: " + task.key);
        }
    }
}

std::optional<std::size_t> TaskList::indexOf(const TaskKey& key) const noexcept {
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
        if (tasks_[i].key == key) {
            return i;
        }
    }
    return std::nullopt;
}

TaskList defaultTasks(Precheck unneededPackages) {
    // Column 3 of the unneeded-package table holds the package name; the
    // first four lines are the repository banner and table header.
    const std::string removeDeps =
        "zypper packages --unneeded"
        " | awk -F'|' 'NR<=4 {next} {print $3}'"
        " | grep -v Name"
        " | xargs zypper -n remove --clean-deps";

    return TaskList({
        {"refresh", "Refreshing Repos", "zypper -n refresh", {}},
        {"update", "Updating Packages", "zypper -n update", {}},
        {"dist_upgrade", "Updating Distro", "zypper -n dist-upgrade", {}},
        {"remove_deps", "Removing old dependencies", removeDeps, std::move(unneededPackages)},
        {"update_flatpaks", "Updating flatpaks", "flatpak update --system -y", {}},
        {"remove_flatpaks", "Removing old flatpaks", "flatpak uninstall --unused --system -y", {}},
    });
}

}
