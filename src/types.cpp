/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/types.hpp"

namespace tumbleup {

const char* statusLabel(Status status) noexcept {
    switch (status) {
        case Status::Pending:   return " PENDING ";
        case Status::Running:   return " RUNNING ";
        case Status::Completed: return "COMPLETED";
        case Status::Skipped:   return " SKIPPED ";
        case Status::Failed:    return "  FAILED ";
        default: return " UNKNOWN ";
    }
}

bool isLegalTransition(Status from, Status to) noexcept {
    switch (from) {
        case Status::Pending:
            return to == Status::Running || to == Status::Skipped || to == Status::Completed;
        case Status::Running:
            return to == Status::Completed || to == Status::Failed;
        default:
            return false; // terminal states never change
    }
}

}
