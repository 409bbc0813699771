/*
 * tumbleup - Full system update (tumbleup)
 * Copyright (c) 2025 The tumbleup Authors
 * SPDX-License-Identifier: MIT
 */

#include "tumbleup/config.hpp"
#include "tumbleup/logger.hpp"
#include "tumbleup/updater.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

using namespace tumbleup;

constexpr const char* VERSION = "0.6.0";

void printUsage(const char* progName) {
    std::cout << "tumbleup - full system update v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << "\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Runs, in order: zypper refresh, update and dist-upgrade, removal of\n";
    std::cout << "unneeded packages, flatpak update and removal of unused flatpaks.\n";
    std::cout << "The first failing step stops the run; later steps are skipped.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TUMBLEUP_LOG_DIR      Where the run log is written (default: /tmp)\n";
    std::cout << "  TUMBLEUP_REFRESH_MS   Dashboard refresh interval (default: 1000)\n";
    std::cout << "  TUMBLEUP_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  TUMBLEUP_DIAG_FILE    Write diagnostic logging to this file\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN so diagnostics stay out of the dashboard
    if (!std::getenv("TUMBLEUP_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        std::cerr << "Error: Unexpected argument: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        Config config = Config::fromEnv();
        if (!config.diagFile.empty() && !Logger::setOutputFile(config.diagFile)) {
            std::cerr << "Error: Cannot open diagnostic file: " << config.diagFile.string() << "\n";
            return 1;
        }

        RunContext context = RunContext::create(config);
        Updater updater(context, std::cout);
        return updater.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "Error: Unknown error during update\n";
        return 1;
    }
}
