// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace mediashelf {

namespace {

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <file>  Configuration file (default: mediashelf.json)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  --precache           Generate the cache for the whole media tree and exit\n");
    printf("  --no-watch           Don't watch the media tree for changes\n");
    printf("  -h, --help           Show this help message\n");
}

/// Value of `--opt value` or `--opt=value`, nullptr (with message) if missing
const char* option_value(int argc, char** argv, int& i, const char* name) {
    const size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", name);
    return nullptr;
}

bool matches(const char* arg, const char* name) {
    const size_t len = strlen(name);
    return strcmp(arg, name) == 0 || (strncmp(arg, name, len) == 0 && arg[len] == '=');
}

} // namespace

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Configuration file
        if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            const char* value = option_value(argc, argv, i, argv[i][1] == 'c' ? "-c" : "--config");
            if (!value) {
                return false;
            }
            args.config_path = value;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                return false;
            }
            args.log_file = value;
        }
        // Operation
        else if (strcmp(argv[i], "--precache") == 0) {
            args.precache_only = true;
        } else if (strcmp(argv[i], "--no-watch") == 0) {
            args.no_watch = true;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }
    return true;
}

} // namespace mediashelf
