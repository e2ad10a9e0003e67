// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_library.h"
#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <sstream>
#include <thread>

using namespace mediashelf;
using namespace mediashelf::test;

namespace fs = std::filesystem;

namespace {

MediaSettings library_settings(const TempDir& tmp) {
    MediaSettings settings;
    settings.media_path = tmp.media_root();
    settings.cache_path = tmp.cache_root();
    settings.enable_previews = true;
    settings.preview_max_side = 400;
    settings.extractor_command = "mediashelf-no-such-extractor";
    settings.enable_watcher = false;
    return settings;
}

WatcherSettings fast_watcher() {
    WatcherSettings settings;
    settings.settle_time = std::chrono::milliseconds(50);
    settings.retry_delay = std::chrono::milliseconds(50);
    settings.max_attempts = 2;
    settings.poll_interval_ms = 20;
    return settings;
}

/// Decode what a write_* call streamed
RgbaImage decode_stream(const std::ostringstream& out) {
    const std::string data = out.str();
    RgbaImage image;
    MediaError err = image_ops::decode_memory(reinterpret_cast<const uint8_t*>(data.data()),
                                              data.size(), "stream", image);
    REQUIRE(err);
    return image;
}

} // namespace

// ============================================================================
// Thumbnails
// ============================================================================

TEST_CASE("MediaLibrary: thumbnails", "[library][thumbnail]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);

    SECTION("generated for a plain image") {
        write_test_jpeg(tmp.media("photo.jpg"), 800, 600);
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "photo.jpg"));
        RgbaImage thumb = decode_stream(out);
        REQUIRE(thumb.width == 256);
        REQUIRE(thumb.height == 192);
        REQUIRE(fs::exists(tmp.cache("photo.thumb.jpg")));
    }

    SECTION("embedded EXIF thumbnail is served verbatim") {
        std::vector<uint8_t> embedded = make_thumbnail_jpeg(160, 120);
        write_bytes(tmp.media("camera.jpg"),
                    make_jpeg(solid_image(640, 480, 1, 2, 3), std::nullopt, embedded));
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "camera.jpg"));
        REQUIRE(out.str() == std::string(embedded.begin(), embedded.end()));
        REQUIRE_FALSE(fs::exists(tmp.cache("camera.thumb.jpg")));
    }

    SECTION("embedded EXIF thumbnail is rotated upright") {
        write_bytes(tmp.media("turned.jpg"),
                    make_jpeg(solid_image(640, 480, 1, 2, 3), 6, make_thumbnail_jpeg(160, 120)));
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "turned.jpg"));
        RgbaImage thumb = decode_stream(out);
        REQUIRE(thumb.width == 120);
        REQUIRE(thumb.height == 160);
    }

    SECTION("EXIF thumbnails can be ignored") {
        settings.ignore_exif_thumbs = true;
        write_test_jpeg_with_thumbnail(tmp.media("camera.jpg"), 640, 480);
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "camera.jpg"));
        RgbaImage thumb = decode_stream(out);
        REQUIRE(thumb.width == 256);
        REQUIRE(thumb.height == 192);
    }

    SECTION("disabled cache still serves EXIF thumbnails") {
        settings.enable_thumbnails = false;
        write_test_jpeg(tmp.media("plain.jpg"), 300, 300);
        write_test_jpeg_with_thumbnail(tmp.media("camera.jpg"), 640, 480);
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "plain.jpg").result == MediaResult::DISABLED);
        REQUIRE(library.write_thumbnail(out, "camera.jpg"));
        REQUIRE_FALSE(fs::exists(tmp.cache("plain.thumb.jpg")));
    }

    SECTION("errors") {
        write_text(tmp.media("notes.txt"), "x");
        MediaLibrary library(settings);

        std::ostringstream out;
        REQUIRE(library.write_thumbnail(out, "notes.txt").result ==
                MediaResult::UNSUPPORTED_TYPE);
        REQUIRE(library.write_thumbnail(out, "missing.png").result == MediaResult::NOT_FOUND);
        REQUIRE(library.write_thumbnail(out, "../secret.jpg").result ==
                MediaResult::PATH_ESCAPE);
        REQUIRE(out.str().empty());
    }
}

// ============================================================================
// Previews
// ============================================================================

TEST_CASE("MediaLibrary: previews", "[library][preview]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    write_test_jpeg(tmp.media("large.jpg"), 1200, 900);
    write_test_jpeg(tmp.media("small.jpg"), 200, 100);
    write_text(tmp.media("clip.mp4"), "fake video");

    SECTION("large image") {
        MediaLibrary library(settings);
        std::ostringstream out;
        REQUIRE(library.write_preview(out, "large.jpg"));
        RgbaImage preview = decode_stream(out);
        REQUIRE(preview.width == 400);
        REQUIRE(preview.height == 300);
    }

    SECTION("small image is reported, not served") {
        MediaLibrary library(settings);
        std::ostringstream out;
        REQUIRE(library.write_preview(out, "small.jpg").result ==
                MediaResult::TOO_SMALL_FOR_PREVIEW);
        REQUIRE(out.str().empty());
    }

    SECTION("video is unsupported before the feature switch is consulted") {
        settings.enable_previews = false;
        MediaLibrary library(settings);
        std::ostringstream out;
        REQUIRE(library.write_preview(out, "clip.mp4").result == MediaResult::UNSUPPORTED_TYPE);
        REQUIRE(library.write_preview(out, "large.jpg").result == MediaResult::DISABLED);
    }
}

// ============================================================================
// Rotation
// ============================================================================

TEST_CASE("MediaLibrary: rotation", "[library][orientation]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    write_bytes(tmp.media("turned.jpg"), make_jpeg(solid_image(60, 40, 9, 9, 9), 8));
    write_test_jpeg(tmp.media("upright.jpg"), 60, 40);
    write_test_png(tmp.media("image.png"), 60, 40);

    SECTION("rotation needed only for tagged JPEGs") {
        MediaLibrary library(settings);
        REQUIRE(library.is_rotation_needed("turned.jpg"));
        REQUIRE_FALSE(library.is_rotation_needed("upright.jpg"));
        REQUIRE_FALSE(library.is_rotation_needed("image.png"));
        REQUIRE_FALSE(library.is_rotation_needed("../turned.jpg"));
    }

    SECTION("auto-rotation switched off") {
        settings.auto_rotate = false;
        MediaLibrary library(settings);
        REQUIRE_FALSE(library.is_rotation_needed("turned.jpg"));
    }

    SECTION("rotate_and_write streams the upright image") {
        MediaLibrary library(settings);
        std::ostringstream out;
        REQUIRE(library.rotate_and_write(out, "turned.jpg"));
        RgbaImage image = decode_stream(out);
        REQUIRE(image.width == 40);
        REQUIRE(image.height == 60);
    }

    SECTION("rotate_and_write errors") {
        MediaLibrary library(settings);
        std::ostringstream out;
        REQUIRE(library.rotate_and_write(out, "gone.jpg").result == MediaResult::NOT_FOUND);
        REQUIRE(library.rotate_and_write(out, "../x.jpg").result == MediaResult::PATH_ESCAPE);
    }
}

// ============================================================================
// Albums and sweeps
// ============================================================================

TEST_CASE("MediaLibrary: album thumbnails survive cleanup", "[library][album]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    settings.enable_cleanup = true;
    write_test_jpeg(tmp.media("trip/a.jpg"), 300, 200);
    write_test_png(tmp.media("trip/b.png"), 200, 300);
    fs::create_directories(tmp.media_root() + "/trip/nested");
    MediaLibrary library(settings);

    std::ostringstream out;
    REQUIRE(library.write_album_thumbnail(out, "trip"));
    RgbaImage collage = decode_stream(out);
    REQUIRE(collage.width == 256);
    REQUIRE(collage.height == 256);

    std::string collage_key =
        "trip/" + AlbumCollageGenerator::collage_name("trip", {"a.jpg", "b.png"});
    REQUIRE(fs::exists(tmp.cache(collage_key)));
    REQUIRE(library.cache().has_album_thumbnail(collage_key));

    PrecacheStatistics stats = library.sweep("trip", false, true, false);
    REQUIRE(stats.removed_cache_files == 0);
    REQUIRE(fs::exists(tmp.cache(collage_key)));

    SECTION("a changed album gets a new collage and the old one is an orphan") {
        write_test_jpeg(tmp.media("trip/c.jpg"), 100, 100);
        std::ostringstream again;
        REQUIRE(library.write_album_thumbnail(again, "trip"));

        stats = library.sweep("trip", false, true, false);
        REQUIRE(stats.removed_cache_files == 1);
        REQUIRE_FALSE(fs::exists(tmp.cache(collage_key)));
    }

    SECTION("folder without media has no collage") {
        std::ostringstream none;
        REQUIRE(library.write_album_thumbnail(none, "trip/nested").result ==
                MediaResult::NOT_FOUND);
    }
}

TEST_CASE("MediaLibrary: listing and startup precache", "[library][precache]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    settings.gen_thumbs_on_startup = true;
    settings.gen_previews_on_startup = true;
    write_test_jpeg(tmp.media("a.jpg"), 1000, 800);
    write_test_png(tmp.media("sub/b.png"), 64, 64);

    MediaLibrary library(settings);

    std::vector<MediaEntry> entries;
    REQUIRE(library.list_directory("", entries));
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].name == "a.jpg");
    REQUIRE(entries[1].type == MediaType::FOLDER);

    REQUIRE(library.start());
    library.stop();
    REQUIRE_FALSE(library.is_precache_in_progress());
    REQUIRE(fs::exists(tmp.cache("a.thumb.jpg")));
    REQUIRE(fs::exists(tmp.cache("a.preview.jpg")));
    REQUIRE(fs::exists(tmp.cache("sub/b.thumb.jpg")));
    REQUIRE_FALSE(fs::exists(tmp.cache("sub/b.preview.jpg")));
}

// ============================================================================
// Watcher integration
// ============================================================================

TEST_CASE("MediaLibrary: watcher keeps the cache in sync", "[library][watcher][slow]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    settings.enable_watcher = true;
    MediaLibrary library(settings, fast_watcher());
    REQUIRE(library.start());
    REQUIRE(library.watcher() != nullptr);
    REQUIRE(library.watcher()->is_running());

    SECTION("added file gets thumbnail and preview, removal cleans up") {
        write_test_jpeg(tmp.media("new/photo.jpg"), 800, 600);
        REQUIRE(wait_for([&] { return fs::exists(tmp.cache("new/photo.thumb.jpg")); }));
        REQUIRE(wait_for([&] { return fs::exists(tmp.cache("new/photo.preview.jpg")); }));

        fs::remove(tmp.media("new/photo.jpg"));
        REQUIRE(wait_for([&] { return !fs::exists(tmp.cache("new/photo.thumb.jpg")); }));
        REQUIRE_FALSE(fs::exists(tmp.cache("new/photo.preview.jpg")));
    }

    SECTION("rewriting a failed file clears its error marker") {
        write_corrupt_image(tmp.media("late.jpg"));
        REQUIRE(wait_for([&] { return fs::exists(tmp.cache("late.thumb.err.txt")); }));

        write_test_jpeg(tmp.media("late.jpg"), 300, 200);
        REQUIRE(wait_for([&] { return fs::exists(tmp.cache("late.thumb.jpg")); }));
        REQUIRE_FALSE(fs::exists(tmp.cache("late.thumb.err.txt")));
    }

    SECTION("removed directory takes its cache subtree along") {
        write_test_png(tmp.media("album/x.png"), 50, 50);
        REQUIRE(wait_for([&] { return fs::exists(tmp.cache("album/x.thumb.jpg")); }));

        fs::remove_all(tmp.media_root() + "/album");
        REQUIRE(wait_for([&] { return !fs::exists(tmp.cache("album")); }));
    }

    library.stop();
    REQUIRE(library.watcher() == nullptr);
}

TEST_CASE("MediaLibrary: watcher waits for locked uploads", "[library][watcher][lock][slow]") {
    TempDir tmp;
    MediaSettings settings = library_settings(tmp);
    settings.enable_watcher = true;
    MediaLibrary library(settings, fast_watcher());
    REQUIRE(library.start());

    const std::string staging = tmp.path() + "/staging.jpg";
    write_test_jpeg(staging, 800, 600);
    ForeignLock writer(staging);
    REQUIRE(writer.held());
    fs::rename(staging, tmp.media_root() + "/upload.jpg");

    // Longer than max_attempts retries would take if the lock were ignored
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    REQUIRE_FALSE(fs::exists(tmp.cache("upload.thumb.jpg")));
    REQUIRE_FALSE(fs::exists(tmp.cache("upload.thumb.err.txt")));
    REQUIRE_FALSE(fs::exists(tmp.cache("upload.preview.err.txt")));

    writer.release();
    REQUIRE(wait_for([&] { return fs::exists(tmp.cache("upload.thumb.jpg")); }));
    REQUIRE(wait_for([&] { return fs::exists(tmp.cache("upload.preview.jpg")); }));
    REQUIRE_FALSE(fs::exists(tmp.cache("upload.thumb.err.txt")));

    library.stop();
}
