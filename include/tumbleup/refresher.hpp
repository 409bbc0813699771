/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace tumbleup {

using RenderCallback = std::function<void()>;

// Background thread that redraws the dashboard on a fixed interval, using
// whatever state is current at that moment.
class Refresher {
public:
    explicit Refresher(std::chrono::milliseconds interval) noexcept;
    ~Refresher();

    Refresher(const Refresher&) = delete;
    Refresher& operator=(const Refresher&) = delete;
    Refresher(Refresher&&) = delete;
    Refresher& operator=(Refresher&&) = delete;

    [[nodiscard]] bool start(RenderCallback render);
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t ticks() const noexcept { return ticks_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    void refreshLoop();

    std::chrono::milliseconds interval_;
    RenderCallback render_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> ticks_{0};

    std::thread thread_;
};

}
