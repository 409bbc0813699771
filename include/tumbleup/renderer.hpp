/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace tumbleup {

class StatusBoard;
class LogSink;
class TerminalMetrics;

// One point-in-time picture of the dashboard. Recomputed on every call.
struct RenderFrame {
    int rows = 0;
    int columns = 0;
    bool tooSmall = false;
    std::vector<std::string> summary;
    std::vector<std::string> log;

    // Screen contents, starting with the clear-screen sequence.
    [[nodiscard]] std::string text() const;

    bool operator==(const RenderFrame& other) const {
        return rows == other.rows && columns == other.columns && tooSmall == other.tooSmall &&
               summary == other.summary && log == other.log;
    }
    bool operator!=(const RenderFrame& other) const { return !(*this == other); }
};

class SummaryRenderer final {
public:
    SummaryRenderer(const StatusBoard& board, const LogSink& sink,
                    const TerminalMetrics& terminal, std::ostream& out) noexcept;

    SummaryRenderer(const SummaryRenderer&) = delete;
    SummaryRenderer& operator=(const SummaryRenderer&) = delete;
    SummaryRenderer(SummaryRenderer&&) = delete;
    SummaryRenderer& operator=(SummaryRenderer&&) = delete;

    // Reads board, log and terminal size; never modifies them.
    [[nodiscard]] RenderFrame compose() const;

    // compose() and write the frame. Safe to call from several threads.
    void render();

    // Lines taken by the summary box for a given task count, plus two
    // spare rows kept free below the log.
    [[nodiscard]] static int summaryHeight(std::size_t taskCount) noexcept;

    // Hard wrap at exactly width code points, no word boundaries.
    [[nodiscard]] static std::vector<std::string> wrapLines(const std::vector<std::string>& lines, int width);

    // What a terminal would show for one raw output line: text after the
    // last carriage return, tabs expanded, other control bytes dropped.
    [[nodiscard]] static std::string visibleText(const std::string& line);

    [[nodiscard]] static std::string tooSmallMessage();

private:
    [[nodiscard]] std::vector<std::string> summaryLines() const;

    const StatusBoard& board_;
    const LogSink& sink_;
    const TerminalMetrics& terminal_;
    std::ostream& out_;
    std::mutex renderMutex_;
};

}
