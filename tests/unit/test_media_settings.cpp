// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "media_settings.h"
#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace mediashelf;
using namespace mediashelf::test;

namespace {

MediaSettings valid_settings() {
    MediaSettings settings;
    settings.media_path = "/srv/media";
    settings.cache_path = "/var/cache/mediashelf";
    return settings;
}

} // namespace

TEST_CASE("MediaSettings: validation", "[settings]") {
    MediaSettings settings = valid_settings();
    REQUIRE(settings.validate());

    SECTION("media path is required") {
        settings.media_path.clear();
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }

    SECTION("cache path is required") {
        settings.cache_path.clear();
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }

    SECTION("cache must not be the media tree") {
        settings.cache_path = "/srv/media/";
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }

    SECTION("cache must not live inside the media tree") {
        settings.cache_path = "/srv/media/.cache";
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }

    SECTION("cache beside the media tree is fine") {
        settings.cache_path = "/srv/media-cache";
        REQUIRE(settings.validate());
    }

    SECTION("numeric limits") {
        settings.preview_max_side = 0;
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);

        settings.preview_max_side = 1280;
        settings.extract_timeout_sec = 0;
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }

    SECTION("extractor command is required") {
        settings.extractor_command.clear();
        REQUIRE(settings.validate().result == MediaResult::CONFIG_ERROR);
    }
}

TEST_CASE("MediaSettings: derived component settings", "[settings]") {
    MediaSettings settings = valid_settings();
    settings.preview_max_side = 900;
    settings.previews_for_small_images = true;
    settings.extractor_command = "/opt/ffmpeg/bin/ffmpeg";
    settings.extract_timeout_sec = 12;
    settings.ignore_exif_thumbs = true;
    settings.enable_cleanup = true;

    ArtifactCacheSettings cache = settings.cache_settings();
    REQUIRE(cache.preview_max_side == 900);
    REQUIRE(cache.preview_small_images);
    REQUIRE(cache.extractor_command == "/opt/ffmpeg/bin/ffmpeg");
    REQUIRE(cache.extract_timeout == std::chrono::seconds(12));
    REQUIRE(cache.thumbnail_size == 256);

    SweepOptions sweep = settings.sweep_options();
    REQUIRE(sweep.ignore_exif_thumbs);
    REQUIRE(sweep.enable_cleanup);
}

TEST_CASE("MediaSettings: load from configuration file", "[settings][config]") {
    TempDir tmp;
    const std::string path = tmp.path() + "/mediashelf.json";

    SECTION("complete file") {
        write_text(path, R"({
            "media": {"path": "/srv/photos", "auto_rotate": false, "ignore_exif_thumbs": true},
            "cache": {"path": "/var/cache/ms", "enable_thumbnails": true,
                      "gen_thumbs_on_startup": true, "gen_thumbs_on_add": false,
                      "enable_cleanup": true},
            "preview": {"enable": true, "max_side": 1600, "gen_on_startup": true,
                        "gen_on_add": false, "gen_for_small_images": true},
            "video": {"extractor_command": "avconv", "extract_timeout_sec": 5},
            "watcher": {"enable": false},
            "log_level": "debug",
            "log_path": "/var/log/ms.log"
        })");
        Config config;
        config.init(path);

        MediaSettings settings;
        REQUIRE(MediaSettings::load(config, settings));
        REQUIRE(settings.media_path == "/srv/photos");
        REQUIRE_FALSE(settings.auto_rotate);
        REQUIRE(settings.ignore_exif_thumbs);
        REQUIRE(settings.cache_path == "/var/cache/ms");
        REQUIRE(settings.gen_thumbs_on_startup);
        REQUIRE_FALSE(settings.gen_thumbs_on_add);
        REQUIRE(settings.enable_cleanup);
        REQUIRE(settings.enable_previews);
        REQUIRE(settings.preview_max_side == 1600);
        REQUIRE(settings.gen_previews_on_startup);
        REQUIRE_FALSE(settings.gen_previews_on_add);
        REQUIRE(settings.previews_for_small_images);
        REQUIRE(settings.extractor_command == "avconv");
        REQUIRE(settings.extract_timeout_sec == 5);
        REQUIRE_FALSE(settings.enable_watcher);
        REQUIRE(settings.log_level == "debug");
        REQUIRE(settings.log_path == "/var/log/ms.log");
    }

    SECTION("defaults fill in missing keys") {
        write_text(path, R"({"media": {"path": "/srv/photos"}})");
        Config config;
        config.init(path);

        MediaSettings settings;
        REQUIRE(MediaSettings::load(config, settings));
        REQUIRE(settings.auto_rotate);
        REQUIRE(settings.enable_thumbnails);
        REQUIRE_FALSE(settings.enable_previews);
        REQUIRE(settings.preview_max_side == 1280);
        REQUIRE(settings.extractor_command == "ffmpeg");
        REQUIRE(settings.enable_watcher);
        REQUIRE_FALSE(settings.cache_path.empty());
    }

    SECTION("freshly created default file has no media path") {
        Config config;
        config.init(path);

        MediaSettings settings;
        REQUIRE(MediaSettings::load(config, settings).result == MediaResult::CONFIG_ERROR);
    }

    SECTION("wrong value type") {
        write_text(path, R"({"media": {"path": "/srv/photos"}, "preview": {"max_side": "big"}})");
        Config config;
        config.init(path);

        MediaSettings settings;
        settings.media_path = "unchanged";
        REQUIRE(MediaSettings::load(config, settings).result == MediaResult::CONFIG_ERROR);
        REQUIRE(settings.media_path == "unchanged");
    }
}
