/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/status_board.hpp"
#include "tumbleup/logger.hpp"

namespace tumbleup {

StatusBoard::StatusBoard(const TaskList& tasks)
    : tasks_(tasks), statuses_(tasks.size(), Status::Pending) {
    LOG_DEBUG("Status board created for " + std::to_string(tasks.size()) + " tasks");
}

bool StatusBoard::set(const TaskKey& key, Status status) {
    auto index = tasks_.indexOf(key);
    if (!index) {
        LOG_ERROR("Unknown task key: " + key);
        return false;
    }
    return setAt(*index, status);
}

bool StatusBoard::setAt(std::size_t index, Status status) {
    Status previous = Status::Pending;
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= statuses_.size()) {
            LOG_ERROR("Task index out of range: " + std::to_string(index));
            return false;
        }
        previous = statuses_[index];
        statuses_[index] = status;
        listener = listener_;
    }

    LOG_DEBUG(tasks_.at(index).key + ": " + statusLabel(previous) + "-> " + statusLabel(status));
    if (listener) {
        listener(index, previous, status);
    }
    return true;
}

std::optional<Status> StatusBoard::get(const TaskKey& key) const {
    auto index = tasks_.indexOf(key);
    if (!index) {
        return std::nullopt;
    }
    return getAt(*index);
}

std::optional<Status> StatusBoard::getAt(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= statuses_.size()) {
        return std::nullopt;
    }
    return statuses_[index];
}

std::vector<Status> StatusBoard::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statuses_;
}

void StatusBoard::setListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

}
