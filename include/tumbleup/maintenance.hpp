/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>
#include <vector>

#include "tumbleup/task.hpp"

namespace tumbleup {

class CommandExecutor;

// Produces the advisory text printed after the run.
using Diagnostics = std::function<std::string()>;

// Package names from `zypper packages --unneeded` table output.
[[nodiscard]] std::vector<std::string> parseUnneededPackages(const std::string& table);

// True when zypper reports at least one unneeded package.
[[nodiscard]] Precheck unneededPackagesCheck(CommandExecutor& executor);

// Report built from `zypper ps -s` and `rpmconfigcheck` output.
[[nodiscard]] std::string formatPostRunReport(const std::string& processes, const std::string& configCheck);

[[nodiscard]] Diagnostics postRunDiagnostics(CommandExecutor& executor);

}
