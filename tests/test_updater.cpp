/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/updater.hpp"
#include "tumbleup/status_board.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <sstream>

using namespace tumbleup;
using namespace std::chrono_literals;
using tumbleup::test::FakeExecutor;
using tumbleup::test::FixedMetrics;
using tumbleup::test::TempDirTest;

namespace {
CaptureResult ok(const std::string& output) {
    CaptureResult result;
    result.ok = true;
    result.exitCode = 0;
    result.output = output;
    return result;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}
}

class UpdaterTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        context_.runId = "2025-01-01_00-00-00-000";
        context_.config.logDir = dir();
        context_.config.refreshInterval = 20ms;
        context_.logPath = dir() / (context_.runId + "_os-update.log");

        auto executor = std::make_unique<FakeExecutor>();
        executor_ = executor.get();
        executor_->captures["zypper packages --unneeded"] = ok(
            "Loading repository data...\n"
            "Reading installed packages...\n"
            "S | Repository | Name | Version | Arch\n"
            "--+------------+------+---------+-----\n"
            "i | @System    | libold2 | 1.0 | x86_64\n");
        executor_->captures["zypper ps -s"] = ok("No processes using deleted files found.\n");
        executor_->captures["rpmconfigcheck"] = ok("Searching for unresolved configuration files\n");

        updater_ = std::make_unique<Updater>(context_, out_, std::move(executor),
                                             std::make_unique<FixedMetrics>(30, 100));
    }

    RunContext context_;
    std::ostringstream out_;
    FakeExecutor* executor_ = nullptr;
    std::unique_ptr<Updater> updater_;
};

TEST_F(UpdaterTest, FullSuccessExitsZero) {
    EXPECT_EQ(updater_->run(), 0);

    for (Status status : updater_->board().snapshot()) {
        EXPECT_EQ(status, Status::Completed);
    }
    EXPECT_EQ(executor_->executed().size(), 6u);

    std::string out = out_.str();
    EXPECT_NE(out.find("Refreshing Repos"), std::string::npos);
    EXPECT_NE(out.find("reboot is probably not necessary"), std::string::npos);
    EXPECT_NE(out.find("Note: If you want to view the log\nLog: " + context_.logPath.string()), std::string::npos);
    EXPECT_TRUE(std::filesystem::exists(context_.logPath));
}

TEST_F(UpdaterTest, DistUpgradeFailureExitsOneAndPrintsLog) {
    executor_->exitCodes["zypper -n dist-upgrade"] = 4;

    EXPECT_EQ(updater_->run(), 1);

    EXPECT_EQ(updater_->board().snapshot(), (std::vector<Status>{
        Status::Completed, Status::Completed, Status::Failed,
        Status::Skipped, Status::Skipped, Status::Skipped}));
    EXPECT_EQ(executor_->executed().size(), 3u);

    std::string out = out_.str();
    EXPECT_NE(out.find("please move it from " + dir().string()), std::string::npos);
    EXPECT_NE(out.find("Log: " + context_.logPath.string()), std::string::npos);
    EXPECT_TRUE(contains(executor_->captured(), "zypper ps -s"));
}

TEST_F(UpdaterTest, FinalFrameShowsTheFailure) {
    executor_->exitCodes["zypper -n dist-upgrade"] = 4;

    EXPECT_EQ(updater_->run(), 1);

    std::string out = out_.str();
    auto lastFrame = out.rfind("\033[2J");
    ASSERT_NE(lastFrame, std::string::npos);
    std::string frame = out.substr(lastFrame, out.find("Log: ", lastFrame) - lastFrame);
    EXPECT_NE(frame.find("  FAILED "), std::string::npos);
    EXPECT_NE(frame.find(" SKIPPED "), std::string::npos);
    EXPECT_EQ(frame.find(" RUNNING "), std::string::npos);
    EXPECT_EQ(frame.find(" PENDING "), std::string::npos);
}

TEST_F(UpdaterTest, RefreshFailureSkipsDiagnostics) {
    executor_->exitCodes["zypper -n refresh"] = 1;

    EXPECT_EQ(updater_->run(), 1);

    EXPECT_FALSE(contains(executor_->captured(), "zypper ps -s"));
    EXPECT_FALSE(contains(executor_->captured(), "rpmconfigcheck"));
    EXPECT_NE(out_.str().find("Log: " + context_.logPath.string()), std::string::npos);
}

TEST_F(UpdaterTest, NoUnneededPackagesCompletesRemovalWithoutRunningIt) {
    executor_->captures["zypper packages --unneeded"] = ok("Loading repository data...\n");

    EXPECT_EQ(updater_->run(), 0);

    EXPECT_EQ(updater_->board().get("remove_deps"), Status::Completed);
    auto executed = executor_->executed();
    EXPECT_EQ(executed.size(), 5u);
    const std::string removal = updater_->tasks().at(3).command;
    EXPECT_FALSE(contains(executed, removal));
}

TEST_F(UpdaterTest, LogFileOutlivesTheUpdater) {
    EXPECT_EQ(updater_->run(), 0);
    updater_.reset();

    EXPECT_TRUE(std::filesystem::exists(context_.logPath));
    EXPECT_GT(std::filesystem::file_size(context_.logPath), 0u);
}
