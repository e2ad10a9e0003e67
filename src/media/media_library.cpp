// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_library.h"

#include "exif_reader.h"
#include "orientation_resolver.h"
#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace mediashelf {

namespace {

MediaError write_bytes(std::ostream& out, const uint8_t* data, size_t size) {
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out) {
        return MediaErrorHelper::io_error("Failed to write response stream");
    }
    return MediaErrorHelper::success();
}

} // namespace

MediaLibrary::MediaLibrary(MediaSettings settings, WatcherSettings watcher_settings)
    : settings_(std::move(settings)), watcher_settings_(watcher_settings),
      cache_(settings_.media_path, settings_.cache_path, settings_.cache_settings()),
      scheduler_(cache_, settings_.sweep_options()) {}

MediaLibrary::~MediaLibrary() {
    stop();
}

MediaError MediaLibrary::start() {
    spdlog::info("[MediaLibrary] Media path: {}", settings_.media_path);
    spdlog::info("[MediaLibrary] Cache path: {}", settings_.cache_path);

    cache_.load_cache();

    if (!cache_.has_video_support()) {
        spdlog::warn("[MediaLibrary] {} not found in PATH, video thumbnails not supported",
                     settings_.extractor_command);
    }

    const bool thumbnails = settings_.enable_thumbnails && settings_.gen_thumbs_on_startup;
    const bool previews = settings_.enable_previews && settings_.gen_previews_on_startup;
    if ((thumbnails || previews) && !scheduler_.start_async(thumbnails, previews)) {
        spdlog::warn("[MediaLibrary] Startup precache not scheduled");
    }

    if (settings_.enable_watcher && !watcher_) {
        auto watcher =
            std::make_unique<DirectoryWatcher>(settings_.media_path, *this, watcher_settings_);
        MediaError err = watcher->start();
        if (!err) {
            spdlog::error("[MediaLibrary] Unable to watch {}: {}", settings_.media_path,
                          err.technical_msg);
            return err;
        }
        watcher_ = std::move(watcher);
    }
    return MediaErrorHelper::success();
}

void MediaLibrary::stop() {
    if (watcher_) {
        watcher_->stop();
        watcher_.reset();
    }
    scheduler_.wait_for_completion();
}

MediaError MediaLibrary::list_directory(const std::string& relative,
                                        std::vector<MediaEntry>& entries) const {
    return MediaCatalog::list(settings_.media_path, relative, entries);
}

MediaError MediaLibrary::stream_file(std::ostream& out, const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return MediaErrorHelper::io_error("Unable to open " + path);
    }
    out << file.rdbuf();
    if (!out) {
        return MediaErrorHelper::io_error("Failed to stream " + path);
    }
    return MediaErrorHelper::success();
}

// ============================================================================
// Serving
// ============================================================================

MediaError MediaLibrary::write_thumbnail(std::ostream& out, const std::string& relative) {
    if (MediaCatalog::classify(relative) == MediaType::UNSUPPORTED) {
        return MediaErrorHelper::unsupported_type(relative, "Thumbnail");
    }

    if (!settings_.ignore_exif_thumbs && MediaCatalog::is_jpeg(relative)) {
        MediaError err = write_exif_thumbnail(out, relative);
        if (err || err.result == MediaResult::PATH_ESCAPE || err.result == MediaResult::IO_ERROR) {
            return err;
        }
    }

    if (!settings_.enable_thumbnails) {
        return MediaErrorHelper::disabled("Thumbnail cache");
    }

    std::string path;
    MediaError err = cache_.generate_thumbnail(relative, path);
    if (!err) {
        return err;
    }
    return stream_file(out, path);
}

MediaError MediaLibrary::write_preview(std::ostream& out, const std::string& relative) {
    if (MediaCatalog::classify(relative) != MediaType::IMAGE) {
        return MediaErrorHelper::unsupported_type(relative, "Preview");
    }
    if (!settings_.enable_previews) {
        return MediaErrorHelper::disabled("Preview");
    }

    std::string path;
    MediaError err = cache_.generate_preview(relative, path);
    if (!err) {
        return err;
    }
    return stream_file(out, path);
}

MediaError MediaLibrary::write_exif_thumbnail(std::ostream& out, const std::string& relative) {
    std::string full_path;
    MediaError err = PathResolver::resolve(settings_.media_path, relative, full_path);
    if (!err) {
        return err;
    }
    if (!MediaCatalog::is_jpeg(relative)) {
        return MediaErrorHelper::unsupported_type(relative, "EXIF thumbnail");
    }

    auto exif = ExifReader::read_file(full_path);
    if (!exif || !exif->has_thumbnail()) {
        return MediaErrorHelper::not_found(relative + " (no EXIF thumbnail)");
    }

    const int code = exif->orientation.value_or(1);
    if (code <= 1) {
        return write_bytes(out, exif->thumbnail.data(), exif->thumbnail.size());
    }

    RgbaImage image;
    err = image_ops::decode_memory(exif->thumbnail.data(), exif->thumbnail.size(), relative, image);
    if (!err) {
        spdlog::warn("[MediaLibrary] Unable to decode EXIF thumbnail for {}", relative);
        return write_bytes(out, exif->thumbnail.data(), exif->thumbnail.size());
    }

    std::vector<uint8_t> jpeg;
    err = image_ops::encode_jpeg(OrientationResolver::apply(image, code), jpeg);
    if (!err) {
        return err;
    }
    return write_bytes(out, jpeg.data(), jpeg.size());
}

bool MediaLibrary::is_rotation_needed(const std::string& relative) const {
    if (!settings_.auto_rotate) {
        return false;
    }
    std::string full_path;
    if (!PathResolver::resolve(settings_.media_path, relative, full_path)) {
        return false;
    }
    return OrientationResolver::needs_rotation(full_path);
}

MediaError MediaLibrary::rotate_and_write(std::ostream& out, const std::string& relative) {
    std::string full_path;
    MediaError err = PathResolver::resolve(settings_.media_path, relative, full_path);
    if (!err) {
        return err;
    }
    if (MediaCatalog::classify(relative) != MediaType::IMAGE) {
        return MediaErrorHelper::unsupported_type(relative, "Rotation");
    }

    std::error_code ec;
    if (!fs::is_regular_file(full_path, ec)) {
        return MediaErrorHelper::not_found(relative);
    }

    RgbaImage image;
    err = OrientationResolver::decode_upright(full_path, image);
    if (!err) {
        return err;
    }

    std::vector<uint8_t> jpeg;
    err = image_ops::encode_jpeg(image, jpeg);
    if (!err) {
        return err;
    }
    return write_bytes(out, jpeg.data(), jpeg.size());
}

MediaError MediaLibrary::album_cell(const std::string& relative, RgbaImage& out) {
    std::string path;
    MediaError err = cache_.generate_thumbnail(relative, path);
    if (!err) {
        return err;
    }
    return image_ops::decode_file(path, out);
}

MediaError MediaLibrary::write_album_thumbnail(std::ostream& out,
                                               const std::string& relative_folder) {
    std::vector<MediaEntry> entries;
    MediaError err = list_directory(relative_folder, entries);
    if (!err) {
        return err;
    }

    std::vector<std::string> files;
    for (const auto& entry : entries) {
        if (entry.type != MediaType::FOLDER) {
            files.push_back(entry.name);
        }
    }

    std::string path;
    err = cache_.generate_album_thumbnail(
        relative_folder, files,
        [this](const std::string& relative, RgbaImage& image) {
            return album_cell(relative, image);
        },
        path);
    if (!err) {
        return err;
    }
    return stream_file(out, path);
}

// ============================================================================
// Precache
// ============================================================================

bool MediaLibrary::is_precache_in_progress() const {
    return scheduler_.is_in_progress();
}

PrecacheStatistics MediaLibrary::sweep(const std::string& relative, bool recursive,
                                       bool thumbnails, bool previews) {
    return scheduler_.sweep(relative, recursive, thumbnails, previews);
}

// ============================================================================
// Watcher events
// ============================================================================

MediaError MediaLibrary::on_file_added(const std::string& relative, FailurePolicy policy,
                                       bool replaced) {
    if (replaced) {
        // New content, old artifacts and error markers no longer apply
        cache_.remove_artifacts(relative);
    }

    MediaError result = MediaErrorHelper::success();
    const MediaType type = MediaCatalog::classify(relative);
    std::string path;

    if (settings_.enable_thumbnails && settings_.gen_thumbs_on_add) {
        bool has_exif_thumb = false;
        if (!settings_.ignore_exif_thumbs && MediaCatalog::is_jpeg(relative)) {
            std::string full_path;
            if (PathResolver::resolve(settings_.media_path, relative, full_path)) {
                auto exif = ExifReader::read_file(full_path);
                has_exif_thumb = exif && exif->has_thumbnail();
            }
        }

        if (!has_exif_thumb) {
            MediaError err = cache_.generate_thumbnail(relative, path, policy);
            if (!err) {
                result = err;
            }
        }
    }

    if (type == MediaType::IMAGE && settings_.enable_previews && settings_.gen_previews_on_add) {
        MediaError err = cache_.generate_preview(relative, path, policy);
        if (!err && err.result != MediaResult::TOO_SMALL_FOR_PREVIEW && result) {
            result = err;
        }
    }

    if (result) {
        spdlog::debug("[MediaLibrary] Cache updated for {}", relative);
    }
    return result;
}

void MediaLibrary::on_file_removed(const std::string& relative) {
    cache_.remove_artifacts(relative);
}

void MediaLibrary::on_directory_removed(const std::string& relative) {
    cache_.remove_directory(relative);
}

} // namespace mediashelf
