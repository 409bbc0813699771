/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

#include "tumbleup/executor.hpp"
#include "tumbleup/log_sink.hpp"
#include "tumbleup/terminal.hpp"

namespace tumbleup::test {

class FixedMetrics final : public TerminalMetrics {
public:
    FixedMetrics(int rows, int columns) : rows_(rows), columns_(columns) {}

    [[nodiscard]] int rows() const override { return rows_; }
    [[nodiscard]] int columns() const override { return columns_; }

    void resize(int rows, int columns) { rows_ = rows; columns_ = columns; }

private:
    int rows_;
    int columns_;
};

// Records every command; writes one line of output per command and
// returns the configured exit code (0 unless listed).
class FakeExecutor final : public CommandExecutor {
public:
    std::map<std::string, int> exitCodes;
    std::map<std::string, CaptureResult> captures;

    [[nodiscard]] int execute(const std::string& command, LogSink& sink) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            executed_.push_back(command);
        }
        (void)sink.append("output of " + command + "\n");
        auto it = exitCodes.find(command);
        return it == exitCodes.end() ? 0 : it->second;
    }

    [[nodiscard]] CaptureResult capture(const std::string& command) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            captured_.push_back(command);
        }
        auto it = captures.find(command);
        if (it != captures.end()) {
            return it->second;
        }
        CaptureResult result;
        result.ok = true;
        result.exitCode = 0;
        return result;
    }

    [[nodiscard]] std::vector<std::string> executed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return executed_;
    }

    [[nodiscard]] std::vector<std::string> captured() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return captured_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> executed_;
    std::vector<std::string> captured_;
};

// Fresh scratch directory per test, removed afterwards.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               ("tumbleup-" + std::string(info->test_suite_name()) + "-" + info->name() + "-" +
                std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};

}
