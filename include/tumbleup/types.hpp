/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace tumbleup {

// Task lifecycle states.
enum class Status : std::uint8_t { Pending, Running, Completed, Skipped, Failed };

// Stable task identifier ("refresh", "dist_upgrade", ...).
using TaskKey = std::string;

// Fixed-width (9 column) label shown inside the summary box.
[[nodiscard]] const char* statusLabel(Status status) noexcept;

// Pending -> Running -> {Completed | Failed}, Pending -> Skipped, and
// Pending -> Completed for a conditional task with nothing to do.
[[nodiscard]] bool isLegalTransition(Status from, Status to) noexcept;

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Skipped || status == Status::Failed;
}

} // namespace tumbleup
