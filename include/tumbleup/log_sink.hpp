/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tumbleup {

// Append-only store of combined command output for one run. Backed by a
// file that is created on the first append and left behind for the
// operator.
//
// Only whole UTF-8 sequences are published to readers: an append that ends
// inside a multi-byte character holds those bytes back until the rest of
// the character arrives.
class LogSink final {
public:
    explicit LogSink(const std::filesystem::path& path) noexcept;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;
    LogSink(LogSink&&) = delete;
    LogSink& operator=(LogSink&&) = delete;

    [[nodiscard]] bool append(std::string_view bytes);

    // Last n lines of the published content; fewer if the sink holds fewer,
    // empty if nothing has been written yet. At most maxBytes are read from
    // the end of the log, so the oldest returned line may be cut at the front.
    [[nodiscard]] std::vector<std::string> tailLines(
        std::size_t n, std::size_t maxBytes = std::numeric_limits<std::size_t>::max()) const;

    [[nodiscard]] std::size_t bytesWritten() const noexcept { return published_.load(std::memory_order_acquire); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Number of trailing bytes that form an incomplete UTF-8 sequence.
    [[nodiscard]] static std::size_t incompleteUtf8Suffix(std::string_view bytes) noexcept;

private:
    [[nodiscard]] bool openIfNeeded();

    std::filesystem::path path_;
    std::mutex writeMutex_;
    std::ofstream out_;
    std::size_t written_ = 0;
    std::string heldBack_;
    std::atomic<std::size_t> published_{0};
};

}
