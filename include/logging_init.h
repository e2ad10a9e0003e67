// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the mediashelf daemon
 *
 * A colored console sink is always installed (unless disabled); one system
 * sink is added on top, chosen by LogTarget. libhv's own hlog is kept in
 * step with the spdlog level.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace mediashelf {
namespace logging {

enum class LogTarget {
    Auto,    ///< journal if available, else syslog, else console only
    Journal, ///< systemd journal (MEDIASHELF_HAS_SYSTEMD builds)
    Syslog,  ///< syslog(3)
    File,    ///< rotating file, 5MB x 3
    Console, ///< console sink only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< LogTarget::File only, empty = /var/log/mediashelf.log
};

/// Install the default logger described by @p config
void init(const LogConfig& config);

/**
 * @brief Parse a level name (trace, debug, info, warn/warning, error, critical, off)
 *
 * Case sensitive. Unknown or empty names yield @p default_level.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::info);

/**
 * @brief Effective level: CLI verbosity, then config value, then info
 *
 * Verbosity maps 1 to info, 2 to debug and 3 or more to trace.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// libhv log level for an spdlog level (libhv has no trace, so trace maps to debug)
int to_hv_level(spdlog::level::level_enum level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace mediashelf
