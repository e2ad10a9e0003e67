// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "media_library.h"
#include "media_settings.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>

#include "hv/hlog.h"

using namespace mediashelf;

// Signal handling
static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
}

static void init_logging(const CliArgs& args, const MediaSettings* settings) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, settings ? settings->log_level : "");
    log_config.target = logging::parse_log_target(args.log_dest);
    log_config.file_path = args.log_file;
    if (settings && log_config.file_path.empty()) {
        log_config.file_path = settings->log_path;
    }
    // A log path in the config implies file logging unless the CLI chose otherwise
    if (args.log_dest.empty() && settings && !settings->log_path.empty()) {
        log_config.target = logging::LogTarget::File;
    }
    logging::init(log_config);
}

int main(int argc, char** argv) {
    // libhv logs to its own file by default, keep it quiet until configured
    hlog_set_level(LOG_LEVEL_WARN);

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return 1;
    }

    // Console-only logging while the configuration is read
    logging::LogConfig early;
    early.level = logging::resolve_log_level(args.verbosity, "");
    early.target = logging::LogTarget::Console;
    logging::init(early);

    Config* config = Config::get_instance();
    config->init(args.config_path);

    MediaSettings settings;
    MediaError err = MediaSettings::load(*config, settings);
    if (!err) {
        spdlog::critical("[Main] Invalid configuration in {}: {}", args.config_path,
                         err.technical_msg);
        return 1;
    }
    if (args.no_watch) {
        settings.enable_watcher = false;
    }

    init_logging(args, &settings);
    setup_signal_handlers();

    MediaLibrary library(settings);

    if (args.precache_only) {
        library.cache().load_cache();
        auto start = std::chrono::steady_clock::now();
        PrecacheStatistics stats =
            library.sweep("", true, settings.enable_thumbnails, settings.enable_previews);
        PrecacheScheduler::log_statistics(
            stats, std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start));
        printf("folders=%d images=%d videos=%d exif=%d image_thumbs=%d video_thumbs=%d "
               "previews=%d failed_folders=%d failed_image_thumbs=%d failed_video_thumbs=%d "
               "failed_previews=%d small=%d removed=%d\n",
               stats.folders, stats.images, stats.videos, stats.exif_thumbnails,
               stats.image_thumbnails, stats.video_thumbnails, stats.image_previews,
               stats.failed_folders, stats.failed_image_thumbnails, stats.failed_video_thumbnails,
               stats.failed_image_previews, stats.small_images, stats.removed_cache_files);
        return 0;
    }

    err = library.start();
    if (!err) {
        spdlog::critical("[Main] Startup failed ({}): {}", media_result_to_string(err.result),
                         err.technical_msg);
        return 1;
    }

    spdlog::info("[Main] mediashelf running, press Ctrl+C to stop");
    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("[Main] Shutting down");
    library.stop();
    return 0;
}
