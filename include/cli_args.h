// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the mediashelf daemon
 */

#include <string>

namespace mediashelf {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "mediashelf.json";

    // Logging
    int verbosity = 0;    // Number of -v flags
    std::string log_dest; // Empty = from config / auto
    std::string log_file; // Empty = from config / default location

    // Operation
    bool precache_only = false; // Sweep once and exit
    bool no_watch = false;      // Don't start the directory watcher
};

/**
 * @brief Parse command-line arguments
 *
 * Prints usage or an error message to stdout on failure.
 *
 * @return false if the program should exit (help shown or invalid arguments)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace mediashelf
