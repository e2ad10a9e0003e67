// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "artifact_cache.h"
#include "media_error.h"
#include "precache_scheduler.h"

#include <string>

namespace mediashelf {

class Config;

/**
 * @brief Validated daemon settings
 *
 * Built from Config by load(), which is the only place JSON pointers are
 * spelled out. Everything downstream takes this struct.
 */
struct MediaSettings {
    // /media
    std::string media_path;
    bool auto_rotate = true;
    bool ignore_exif_thumbs = false;

    // /cache
    std::string cache_path;
    bool enable_thumbnails = true;
    bool gen_thumbs_on_startup = false;
    bool gen_thumbs_on_add = true;
    bool enable_cleanup = false;

    // /preview
    bool enable_previews = false;
    int preview_max_side = 1280;
    bool gen_previews_on_startup = false;
    bool gen_previews_on_add = true;
    bool previews_for_small_images = false;

    // /video
    std::string extractor_command = FrameExtractor::DEFAULT_COMMAND;
    int extract_timeout_sec = 30;

    // /watcher
    bool enable_watcher = true;

    std::string log_level = "info";
    std::string log_path;

    /**
     * @brief Read and validate settings
     *
     * @return CONFIG_ERROR for a missing media path, a cache path equal to or
     *         inside the media path, a wrongly typed value, or a
     *         non-positive size or timeout
     */
    static MediaError load(const Config& config, MediaSettings& out);

    /// Check cross-field constraints of already populated settings
    MediaError validate() const;

    ArtifactCacheSettings cache_settings() const;
    SweepOptions sweep_options() const;
};

} // namespace mediashelf
