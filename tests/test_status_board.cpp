/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/status_board.hpp"
#include <atomic>
#include <thread>
#include <tuple>

#include <gtest/gtest.h>

using namespace tumbleup;

namespace {
TaskList threeTasks() {
    return TaskList({
        {"refresh", "Refreshing Repos", "true", {}},
        {"update", "Updating Packages", "true", {}},
        {"dist_upgrade", "Updating Distro", "true", {}},
    });
}
}

TEST(StatusBoardTest, StartsWithEveryTaskPending) {
    TaskList tasks = threeTasks();
    StatusBoard board(tasks);

    ASSERT_EQ(board.size(), 3u);
    for (Status status : board.snapshot()) {
        EXPECT_EQ(status, Status::Pending);
    }
}

TEST(StatusBoardTest, SetOverwritesAndGetReadsBack) {
    TaskList tasks = threeTasks();
    StatusBoard board(tasks);

    EXPECT_TRUE(board.set("update", Status::Running));
    EXPECT_EQ(board.get("update"), Status::Running);
    EXPECT_TRUE(board.set("update", Status::Completed));
    EXPECT_EQ(board.get("update"), Status::Completed);
    EXPECT_EQ(board.getAt(1), Status::Completed);
    EXPECT_EQ(board.get("refresh"), Status::Pending);
}

TEST(StatusBoardTest, UnknownKeyIsRejected) {
    TaskList tasks = threeTasks();
    StatusBoard board(tasks);

    EXPECT_FALSE(board.set("reboot", Status::Running));
    EXPECT_FALSE(board.get("reboot").has_value());
    EXPECT_FALSE(board.setAt(3, Status::Running));
    EXPECT_FALSE(board.getAt(3).has_value());
}

TEST(StatusBoardTest, ListenerSeesPreviousAndNextStatus) {
    TaskList tasks = threeTasks();
    StatusBoard board(tasks);

    std::vector<std::tuple<std::size_t, Status, Status>> changes;
    board.setListener([&](std::size_t index, Status previous, Status next) {
        changes.emplace_back(index, previous, next);
    });

    ASSERT_TRUE(board.set("dist_upgrade", Status::Running));
    ASSERT_TRUE(board.set("dist_upgrade", Status::Failed));

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0], std::make_tuple(std::size_t{2}, Status::Pending, Status::Running));
    EXPECT_EQ(changes[1], std::make_tuple(std::size_t{2}, Status::Running, Status::Failed));
}

TEST(StatusBoardTest, ConcurrentReaderNeverSeesInvalidValue) {
    TaskList tasks = threeTasks();
    StatusBoard board(tasks);
    std::atomic<bool> done{false};

    std::thread writer([&] {
        const Status cycle[] = {Status::Running, Status::Completed, Status::Skipped, Status::Failed, Status::Pending};
        for (int i = 0; i < 20000; ++i) {
            EXPECT_TRUE(board.setAt(static_cast<std::size_t>(i % 3), cycle[i % 5]));
        }
        done.store(true);
    });

    std::size_t reads = 0;
    while (!done.load()) {
        for (Status status : board.snapshot()) {
            EXPECT_LE(static_cast<int>(status), static_cast<int>(Status::Failed));
        }
        ++reads;
    }
    writer.join();
    EXPECT_GT(reads, 0u);
}
