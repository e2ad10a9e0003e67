// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_settings.h"

#include "config.h"
#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace mediashelf {

MediaError MediaSettings::load(const Config& config, MediaSettings& out) {
    MediaSettings s;
    try {
        s.media_path = config.get<std::string>("/media/path", "");
        s.auto_rotate = config.get<bool>("/media/auto_rotate", s.auto_rotate);
        s.ignore_exif_thumbs = config.get<bool>("/media/ignore_exif_thumbs", s.ignore_exif_thumbs);

        s.cache_path = config.get<std::string>(
            "/cache/path", (fs::temp_directory_path() / "mediashelf").generic_string());
        s.enable_thumbnails = config.get<bool>("/cache/enable_thumbnails", s.enable_thumbnails);
        s.gen_thumbs_on_startup =
            config.get<bool>("/cache/gen_thumbs_on_startup", s.gen_thumbs_on_startup);
        s.gen_thumbs_on_add = config.get<bool>("/cache/gen_thumbs_on_add", s.gen_thumbs_on_add);
        s.enable_cleanup = config.get<bool>("/cache/enable_cleanup", s.enable_cleanup);

        s.enable_previews = config.get<bool>("/preview/enable", s.enable_previews);
        s.preview_max_side = config.get<int>("/preview/max_side", s.preview_max_side);
        s.gen_previews_on_startup =
            config.get<bool>("/preview/gen_on_startup", s.gen_previews_on_startup);
        s.gen_previews_on_add = config.get<bool>("/preview/gen_on_add", s.gen_previews_on_add);
        s.previews_for_small_images =
            config.get<bool>("/preview/gen_for_small_images", s.previews_for_small_images);

        s.extractor_command =
            config.get<std::string>("/video/extractor_command", s.extractor_command);
        s.extract_timeout_sec =
            config.get<int>("/video/extract_timeout_sec", s.extract_timeout_sec);

        s.enable_watcher = config.get<bool>("/watcher/enable", s.enable_watcher);

        s.log_level = config.get<std::string>("/log_level", s.log_level);
        s.log_path = config.get<std::string>("/log_path", s.log_path);
    } catch (const json::exception& e) {
        spdlog::error("[MediaSettings] Invalid value in {}: {}", config.get_path(), e.what());
        return MediaErrorHelper::config_error(e.what());
    }

    MediaError err = s.validate();
    if (!err) {
        spdlog::error("[MediaSettings] {}", err.technical_msg);
        return err;
    }

    out = std::move(s);
    return MediaErrorHelper::success();
}

MediaError MediaSettings::validate() const {
    if (media_path.empty()) {
        return MediaErrorHelper::config_error("/media/path is not set");
    }
    if (cache_path.empty()) {
        return MediaErrorHelper::config_error("/cache/path is empty");
    }

    std::error_code ec;
    const std::string media = PathResolver::normalize(fs::weakly_canonical(media_path, ec).string());
    const std::string cache = PathResolver::normalize(fs::weakly_canonical(cache_path, ec).string());
    if (media == cache) {
        return MediaErrorHelper::config_error("Cache path must differ from media path");
    }
    std::string inside;
    if (PathResolver::relativize(media, cache, inside)) {
        return MediaErrorHelper::config_error("Cache path " + cache_path +
                                              " must not be inside media path " + media_path);
    }

    if (preview_max_side < 1) {
        return MediaErrorHelper::config_error("/preview/max_side must be positive");
    }
    if (extract_timeout_sec < 1) {
        return MediaErrorHelper::config_error("/video/extract_timeout_sec must be positive");
    }
    if (extractor_command.empty()) {
        return MediaErrorHelper::config_error("/video/extractor_command is empty");
    }
    return MediaErrorHelper::success();
}

ArtifactCacheSettings MediaSettings::cache_settings() const {
    ArtifactCacheSettings cs;
    cs.preview_max_side = preview_max_side;
    cs.preview_small_images = previews_for_small_images;
    cs.extractor_command = extractor_command;
    cs.extract_timeout = std::chrono::seconds(extract_timeout_sec);
    return cs;
}

SweepOptions MediaSettings::sweep_options() const {
    SweepOptions options;
    options.ignore_exif_thumbs = ignore_exif_thumbs;
    options.enable_cleanup = enable_cleanup;
    return options;
}

} // namespace mediashelf
