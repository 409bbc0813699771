/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once

namespace tumbleup {

// Terminal geometry. Implementations re-query on every call; the window
// may be resized at any time.
class TerminalMetrics {
public:
    virtual ~TerminalMetrics() = default;

    [[nodiscard]] virtual int rows() const = 0;
    [[nodiscard]] virtual int columns() const = 0;
};

// Size of the terminal attached to a file descriptor (stdout by default),
// falling back to $LINES / $COLUMNS and then 24x80.
class TtyMetrics final : public TerminalMetrics {
public:
    explicit TtyMetrics(int fd = 1) noexcept : fd_(fd) {}

    [[nodiscard]] int rows() const override;
    [[nodiscard]] int columns() const override;

private:
    int fd_;
};

}
