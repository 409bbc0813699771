/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/terminal.hpp"
#include <cstdlib>
#include <sys/ioctl.h>
#include <unistd.h>

namespace tumbleup {

namespace {
int envDimension(const char* name, int fallback) {
    const char* env = std::getenv(name);
    if (env) {
        int value = std::atoi(env);
        if (value > 0) return value;
    }
    return fallback;
}
}

int TtyMetrics::rows() const {
    struct winsize ws{};
    if (ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
        return ws.ws_row;
    }
    return envDimension("LINES", 24);
}

int TtyMetrics::columns() const {
    struct winsize ws{};
    if (ioctl(fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return envDimension("COLUMNS", 80);
}

}
