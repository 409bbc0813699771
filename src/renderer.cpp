/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/renderer.hpp"
#include "tumbleup/config.hpp"
#include "tumbleup/log_sink.hpp"
#include "tumbleup/logger.hpp"
#include "tumbleup/status_board.hpp"
#include "tumbleup/terminal.hpp"

namespace tumbleup {

namespace {
constexpr const char* kClearScreen = "\033[2J\033[1;1H";

constexpr const char* kStyleReset     = "\033[0m";
constexpr const char* kStyleText      = "\033[44;37m"; // blue background
constexpr const char* kStylePending   = "\033[40;37m"; // black
constexpr const char* kStyleRunning   = "\033[43;37m"; // yellow
constexpr const char* kStyleCompleted = "\033[42;37m"; // green
constexpr const char* kStyleFailed    = "\033[41;37m"; // red

constexpr std::size_t kBoxWidth = 44;
constexpr std::size_t kLabelWidth = 27;
constexpr int kSummaryChrome = 6;
constexpr int kTabStop = 8;
// Log bytes read per screen cell: room for multi-byte characters and
// control bytes that never reach the screen.
constexpr std::size_t kTailBytesPerCell = 8;

const char* statusStyle(Status status) noexcept {
    switch (status) {
        case Status::Pending:   return kStylePending;
        case Status::Running:   return kStyleRunning;
        case Status::Completed: return kStyleCompleted;
        case Status::Skipped:   return kStyleText;
        case Status::Failed:    return kStyleFailed;
        default: return kStyleText;
    }
}

bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}
}

std::string RenderFrame::text() const {
    std::string screen = kClearScreen;
    if (tooSmall) {
        screen += SummaryRenderer::tooSmallMessage();
        screen += "\n";
        return screen;
    }
    for (const auto& line : summary) {
        screen += line;
        screen += "\n";
    }
    for (const auto& line : log) {
        screen += line;
        screen += "\n";
    }
    return screen;
}

SummaryRenderer::SummaryRenderer(const StatusBoard& board, const LogSink& sink,
                                 const TerminalMetrics& terminal, std::ostream& out) noexcept
    : board_(board), sink_(sink), terminal_(terminal), out_(out) {
}

RenderFrame SummaryRenderer::compose() const {
    RenderFrame frame;
    frame.rows = terminal_.rows();
    frame.columns = terminal_.columns();

    if (frame.rows < MIN_HEIGHT || frame.columns < MIN_WIDTH) {
        frame.tooSmall = true;
        return frame;
    }

    frame.summary = summaryLines();

    const int logRows = frame.rows - summaryHeight(board_.size());
    if (logRows <= 0) {
        return frame;
    }
    const long availableChars = static_cast<long>(frame.columns) * logRows;
    if (availableChars < LOG_MIN_CHARACTERS) {
        return frame;
    }

    // Every raw line wraps to at least one row, so logRows raw lines are
    // always enough to fill logRows rows.
    std::vector<std::string> raw = sink_.tailLines(static_cast<std::size_t>(logRows),
                                                   static_cast<std::size_t>(availableChars) * kTailBytesPerCell);
    for (auto& line : raw) {
        line = visibleText(line);
    }
    std::vector<std::string> wrapped = wrapLines(raw, frame.columns);
    if (wrapped.size() > static_cast<std::size_t>(logRows)) {
        wrapped.erase(wrapped.begin(), wrapped.end() - logRows);
    }
    frame.log = std::move(wrapped);
    return frame;
}

void SummaryRenderer::render() {
    // Composing under the lock keeps an older snapshot from being written
    // after a newer one.
    std::lock_guard<std::mutex> lock(renderMutex_);
    RenderFrame frame = compose();
    out_ << frame.text() << std::flush;
    LOG_TRACE("Rendered " + std::to_string(frame.columns) + "x" + std::to_string(frame.rows) +
              " frame with " + std::to_string(frame.log.size()) + " log rows");
}

std::vector<std::string> SummaryRenderer::summaryLines() const {
    const std::string border(kBoxWidth, '=');
    const std::vector<Status> statuses = board_.snapshot();

    std::vector<std::string> lines;
    lines.reserve(statuses.size() + 4);
    lines.emplace_back("");
    lines.push_back(std::string(kStyleText) + border + kStyleReset);

    std::size_t index = 0;
    for (const auto& task : board_.tasks()) {
        std::string label = task.label;
        if (label.size() < kLabelWidth) {
            label.append(kLabelWidth - label.size(), '.');
        }
        Status status = statuses[index++];

        std::string line = kStyleText;
        line += "= " + label + "[ ";
        line += statusStyle(status);
        line += statusLabel(status);
        line += kStyleText;
        line += " ] =";
        line += kStyleReset;
        lines.push_back(std::move(line));
    }

    lines.push_back(std::string(kStyleText) + border + kStyleReset);
    lines.emplace_back("");
    return lines;
}

int SummaryRenderer::summaryHeight(std::size_t taskCount) noexcept {
    return static_cast<int>(taskCount) + kSummaryChrome;
}

std::vector<std::string> SummaryRenderer::wrapLines(const std::vector<std::string>& lines, int width) {
    std::vector<std::string> wrapped;
    if (width <= 0) {
        return wrapped;
    }

    for (const auto& line : lines) {
        if (line.empty()) {
            wrapped.emplace_back("");
            continue;
        }

        std::string row;
        int count = 0;
        for (std::size_t i = 0; i < line.size(); ++i) {
            auto c = static_cast<unsigned char>(line[i]);
            if (!isContinuation(c)) {
                if (count == width) {
                    wrapped.push_back(std::move(row));
                    row.clear();
                    count = 0;
                }
                ++count;
            }
            row += line[i];
        }
        if (!row.empty()) {
            wrapped.push_back(std::move(row));
        }
    }
    return wrapped;
}

std::string SummaryRenderer::visibleText(const std::string& line) {
    std::string view = line;
    while (!view.empty() && view.back() == '\r') {
        view.pop_back();
    }
    std::size_t cr = view.rfind('\r');
    if (cr != std::string::npos) {
        view.erase(0, cr + 1);
    }

    std::string visible;
    visible.reserve(view.size());
    int column = 0;
    for (char ch : view) {
        auto c = static_cast<unsigned char>(ch);
        if (ch == '\t') {
            int spaces = kTabStop - (column % kTabStop);
            visible.append(static_cast<std::size_t>(spaces), ' ');
            column += spaces;
        } else if (c < 0x20 || c == 0x7F) {
            continue;
        } else {
            visible += ch;
            if (!isContinuation(c)) {
                ++column;
            }
        }
    }
    return visible;
}

std::string SummaryRenderer::tooSmallMessage() {
    return "Error: The terminal must be at least " + std::to_string(MIN_WIDTH) +
           " columns wide and " + std::to_string(MIN_HEIGHT) + " lines high to display any output.";
}

}
