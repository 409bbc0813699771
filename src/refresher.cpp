/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/refresher.hpp"
#include "tumbleup/logger.hpp"
#include <algorithm>
#include <exception>

namespace tumbleup {

namespace {
constexpr std::chrono::milliseconds kSleepSlice{50};
}

Refresher::Refresher(std::chrono::milliseconds interval) noexcept : interval_(interval) {
    LOG_DEBUG("Refresher created with " + std::to_string(interval.count()) + "ms interval");
}

Refresher::~Refresher() {
    stop();
}

bool Refresher::start(RenderCallback render) {
    if (running_.load()) {
        LOG_WARN("Refresher already running");
        return false;
    }

    if (!render) {
        LOG_ERROR("Invalid render callback provided");
        return false;
    }

    render_ = std::move(render);
    shutdown_.store(false);
    running_.store(true);

    try {
        thread_ = std::thread(&Refresher::refreshLoop, this);
        LOG_DEBUG("Refresher started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start refresher: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Refresher::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    shutdown_.store(true);
    running_.store(false);

    if (thread_.joinable()) {
        thread_.join();
    }

    LOG_DEBUG("Refresher stopped after " + std::to_string(ticks_.load()) + " refreshes");
}

void Refresher::refreshLoop() {
    setThreadName("Refresh");

    while (!shutdown_.load()) {
        auto wakeAt = std::chrono::steady_clock::now() + interval_;
        while (!shutdown_.load()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= wakeAt) {
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, wakeAt - now));
        }
        if (shutdown_.load()) {
            break;
        }

        try {
            render_();
            ++ticks_;
        } catch (const std::exception& e) {
            LOG_ERROR("Refresh error: " + std::string(e.what()));
        }
    }
}

}
