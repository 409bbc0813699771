/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/log_sink.hpp"
#include "tumbleup/logger.hpp"
#include <algorithm>

namespace tumbleup {

namespace {
constexpr std::size_t kReadChunk = 8192;
constexpr std::size_t kMaxUtf8Length = 4;

std::size_t sequenceLength(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x06) return 2;
    if ((lead >> 4) == 0x0E) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1; // stray byte, passed through as is
}
}

LogSink::LogSink(const std::filesystem::path& path) noexcept : path_(path) {
}

bool LogSink::openIfNeeded() {
    if (out_.is_open()) {
        return true;
    }
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    out_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out_) {
        LOG_ERROR("Failed to open log file: " + path_.string());
        return false;
    }
    LOG_DEBUG("Log file created: " + path_.string());
    return true;
}

bool LogSink::append(std::string_view bytes) {
    if (bytes.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!openIfNeeded()) {
        return false;
    }

    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out_.flush();
    if (!out_) {
        LOG_ERROR("Failed to write to log file: " + path_.string());
        out_.clear();
        return false;
    }
    written_ += bytes.size();

    // Only the last few bytes can belong to an unfinished character.
    std::string window = heldBack_;
    std::size_t take = std::min(bytes.size(), kMaxUtf8Length);
    window.append(bytes.substr(bytes.size() - take));
    if (window.size() > kMaxUtf8Length) {
        window.erase(0, window.size() - kMaxUtf8Length);
    }
    std::size_t incomplete = incompleteUtf8Suffix(window);
    heldBack_ = window.substr(window.size() - incomplete);

    published_.store(written_ - incomplete, std::memory_order_release);
    return true;
}

std::vector<std::string> LogSink::tailLines(std::size_t n, std::size_t maxBytes) const {
    std::vector<std::string> lines;
    const std::size_t end = published_.load(std::memory_order_acquire);
    if (n == 0 || end == 0 || maxBytes == 0) {
        return lines;
    }

    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in) {
        return lines;
    }

    // Read backwards until n line breaks precede the final line or the
    // byte budget runs out. Blocks are kept newest first.
    std::vector<std::string> blocks;
    std::size_t pos = end;
    std::size_t breaks = 0;
    std::size_t total = 0;
    while (pos > 0 && total < maxBytes) {
        std::size_t len = std::min({kReadChunk, pos, maxBytes - total});
        pos -= len;

        std::string block(len, '\0');
        in.seekg(static_cast<std::streamoff>(pos));
        in.read(block.data(), static_cast<std::streamsize>(len));
        if (static_cast<std::size_t>(in.gcount()) != len) {
            LOG_WARN("Short read from log file: " + path_.string());
            return lines;
        }

        breaks += static_cast<std::size_t>(std::count(block.begin(), block.end(), '\n'));
        if (pos + len == end && block.back() == '\n') {
            --breaks; // terminator of the last line
        }
        total += len;
        blocks.push_back(std::move(block));
        if (breaks >= n) {
            break;
        }
    }

    std::string buffer;
    buffer.reserve(total);
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
        buffer += *it;
    }

    // A budget cut can land inside a character.
    std::size_t start = 0;
    if (pos > 0) {
        while (start < buffer.size() && (static_cast<unsigned char>(buffer[start]) & 0xC0) == 0x80) {
            ++start;
        }
    }

    while (start <= buffer.size()) {
        std::size_t nl = buffer.find('\n', start);
        if (nl == std::string::npos) {
            if (start < buffer.size()) {
                lines.emplace_back(buffer.substr(start));
            }
            break;
        }
        lines.emplace_back(buffer.substr(start, nl - start));
        start = nl + 1;
    }

    if (lines.size() > n) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(n));
    }
    return lines;
}

std::size_t LogSink::incompleteUtf8Suffix(std::string_view bytes) noexcept {
    std::size_t count = 0;
    for (std::size_t i = bytes.size(); i > 0 && count < kMaxUtf8Length; --i) {
        auto c = static_cast<unsigned char>(bytes[i - 1]);
        ++count;
        if ((c & 0xC0) != 0x80) {
            return count < sequenceLength(c) ? count : 0;
        }
    }
    return 0;
}

}
