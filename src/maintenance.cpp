/*
 * tumbleup - Full System Update Dashboard
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/maintenance.hpp"
#include "tumbleup/executor.hpp"
#include "tumbleup/logger.hpp"
#include <sstream>

namespace tumbleup {

namespace {
constexpr std::size_t kTableHeaderLines = 4;
constexpr std::size_t kNameColumn = 2;

constexpr const char* kNoDeletedFiles = "No processes using deleted files";
constexpr const char* kConfigCheckBanner = "Searching for unresolved configuration files";

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n";
    auto first = value.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(ws);
    return value.substr(first, last - first + 1);
}

std::string stripTrailingNewlines(std::string value) {
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

std::string banner(const std::string& title) {
    std::string rule(title.size() + 4, '#');
    return rule + "\n# " + title + " #\n" + rule + "\n";
}
}

std::vector<std::string> parseUnneededPackages(const std::string& table) {
    std::vector<std::string> packages;
    std::istringstream in(table);
    std::string line;
    std::size_t lineNo = 0;

    while (std::getline(in, line)) {
        if (++lineNo <= kTableHeaderLines) {
            continue;
        }

        std::size_t column = 0;
        std::size_t start = 0;
        std::string cell;
        bool found = false;
        while (start <= line.size()) {
            std::size_t bar = line.find('|', start);
            if (column == kNameColumn) {
                cell = line.substr(start, bar == std::string::npos ? std::string::npos : bar - start);
                found = true;
                break;
            }
            if (bar == std::string::npos) {
                break;
            }
            start = bar + 1;
            ++column;
        }

        if (!found) {
            continue;
        }
        cell = trim(cell);
        if (cell.empty() || cell.find("Name") != std::string::npos) {
            continue;
        }
        packages.push_back(cell);
    }
    return packages;
}

Precheck unneededPackagesCheck(CommandExecutor& executor) {
    return [&executor]() {
        CaptureResult result = executor.capture("zypper packages --unneeded");
        if (!result.ok) {
            LOG_WARN("Unneeded package query failed: " + result.error);
            return false;
        }
        auto packages = parseUnneededPackages(result.output);
        LOG_INFO(std::to_string(packages.size()) + " unneeded package(s) found");
        return !packages.empty();
    };
}

std::string formatPostRunReport(const std::string& processes, const std::string& configCheck) {
    std::string report = "\n\n\n";

    std::string ps = stripTrailingNewlines(processes);
    if (ps.find(kNoDeletedFiles) == std::string::npos) {
        report += banner("Programs that should be restarted");
        report += ps + "\n";
    } else {
        report += "No programs using deleted files so reboot is probably not necessary.\n";
    }

    report += "\n\n\n";

    std::string rpm = stripTrailingNewlines(configCheck);
    if (!rpm.empty() && rpm != kConfigCheckBanner) {
        report += banner("rpm config check");
        report += rpm + "\n";
    } else {
        report += "No rpm configs that need updates.\n";
    }
    return report;
}

Diagnostics postRunDiagnostics(CommandExecutor& executor) {
    return [&executor]() {
        CaptureResult processes = executor.capture("zypper ps -s");
        if (!processes.ok) {
            LOG_WARN("Process check reported a problem: " + processes.error);
        }
        CaptureResult configs = executor.capture("rpmconfigcheck");
        if (!configs.ok) {
            LOG_WARN("rpm config check reported a problem: " + configs.error);
        }
        return formatPostRunReport(processes.output, configs.output);
    };
}

}
