// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "artifact_cache.h"

#include "orientation_resolver.h"
#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mediashelf {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Replace the extension of the last path component, NO_EXTENSION if missing
MediaError replace_extension(const std::string& relative, const std::string& suffix,
                             std::string& out) {
    std::string base = PathResolver::base_name(relative);
    auto dot = base.rfind('.');
    if (dot == std::string::npos) {
        return MediaErrorHelper::no_extension(relative);
    }
    out = relative.substr(0, relative.size() - (base.size() - dot)) + suffix;
    return MediaErrorHelper::success();
}

std::string read_marker(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

long long elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start)
        .count();
}

/// Translucent disc with a white play triangle
RgbaImage build_video_icon(int size) {
    RgbaImage icon(size, size);
    const float center = (size - 1) / 2.0f;
    const float radius = size / 2.0f - 1.0f;

    // Triangle pointing right, roughly centered inside the disc
    const float left = size * 0.37f;
    const float right = size * 0.74f;
    const float top = size * 0.28f;
    const float bottom = size * 0.72f;

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            float dx = x - center;
            float dy = y - center;
            uint8_t* px = icon.at(x, y);
            if (dx * dx + dy * dy > radius * radius) {
                continue;
            }

            float half_height = (bottom - top) / 2.0f * (1.0f - (x - left) / (right - left));
            bool in_triangle = x >= left && x <= right && std::abs(y - center) <= half_height;
            if (in_triangle) {
                px[0] = px[1] = px[2] = 255;
                px[3] = 255;
            } else {
                px[0] = px[1] = px[2] = 0;
                px[3] = 160;
            }
        }
    }
    return icon;
}

} // namespace

// ============================================================================
// KeyedGate
// ============================================================================

KeyedGate::Ticket::Ticket(KeyedGate& gate, std::string key) : gate_(gate), key_(std::move(key)) {
    std::unique_lock<std::mutex> lock(gate_.mutex_);
    gate_.released_.wait(lock, [this] { return gate_.active_.count(key_) == 0; });
    gate_.active_.insert(key_);
}

KeyedGate::Ticket::~Ticket() {
    {
        std::lock_guard<std::mutex> lock(gate_.mutex_);
        gate_.active_.erase(key_);
    }
    gate_.released_.notify_all();
}

// ============================================================================
// Construction
// ============================================================================

ArtifactCache::ArtifactCache(std::string media_root, std::string cache_root,
                             ArtifactCacheSettings settings)
    : media_root_(PathResolver::normalize(media_root)),
      cache_root_(PathResolver::normalize(cache_root)), settings_(std::move(settings)),
      extractor_(settings_.extractor_command, settings_.extract_timeout) {
    try {
        fs::create_directories(cache_root_);
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("[ArtifactCache] Failed to create cache directory: {}", e.what());
    }
    spdlog::debug("[ArtifactCache] Media root {}, cache root {}", media_root_, cache_root_);
}

bool ArtifactCache::has_video_support() const {
    return extractor_.is_available();
}

const RgbaImage& ArtifactCache::video_icon() const {
    std::call_once(video_icon_once_, [this] { video_icon_ = build_video_icon(VIDEO_ICON_SIZE); });
    return video_icon_;
}

// ============================================================================
// Naming
// ============================================================================

MediaError ArtifactCache::thumbnail_name(const std::string& relative, std::string& out) {
    return replace_extension(relative, THUMBNAIL_SUFFIX, out);
}

MediaError ArtifactCache::preview_name(const std::string& relative, std::string& out) {
    return replace_extension(relative, PREVIEW_SUFFIX, out);
}

std::string ArtifactCache::error_marker_name(const std::string& artifact) {
    std::string marker;
    if (!replace_extension(artifact, ERROR_MARKER_EXT, marker)) {
        return artifact + ERROR_MARKER_EXT;
    }
    return marker;
}

// ============================================================================
// Record index
// ============================================================================

void ArtifactCache::record(ArtifactKind kind, const std::string& key, RecordTime time) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_[static_cast<int>(kind)][key] = time;
}

void ArtifactCache::forget(ArtifactKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(records_mutex_);
    records_[static_cast<int>(kind)].erase(key);
}

void ArtifactCache::forget_prefix(const std::string& relative_dir) {
    const std::string prefix = relative_dir + "/";
    std::lock_guard<std::mutex> lock(records_mutex_);
    for (auto& map : records_) {
        for (auto it = map.begin(); it != map.end();) {
            if (it->first == relative_dir || it->first.compare(0, prefix.size(), prefix) == 0) {
                it = map.erase(it);
            } else {
                ++it;
            }
        }
    }
}

bool ArtifactCache::is_recorded(ArtifactKind kind, const std::string& key) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_[static_cast<int>(kind)].count(key) > 0;
}

bool ArtifactCache::has_thumbnail(const std::string& relative) const {
    std::string name, key, path;
    return thumbnail_name(relative, name) && canonical_key(name, key, path) &&
           is_recorded(ArtifactKind::THUMBNAIL, key);
}

bool ArtifactCache::has_preview(const std::string& relative) const {
    std::string name, key, path;
    return preview_name(relative, name) && canonical_key(name, key, path) &&
           is_recorded(ArtifactKind::PREVIEW, key);
}

bool ArtifactCache::has_album_thumbnail(const std::string& collage_relative) const {
    return is_recorded(ArtifactKind::ALBUM, collage_relative);
}

size_t ArtifactCache::record_count(ArtifactKind kind) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    return records_[static_cast<int>(kind)].size();
}

void ArtifactCache::load_cache() {
    std::error_code ec;
    if (!fs::is_directory(cache_root_, ec)) {
        return;
    }

    auto start = std::chrono::steady_clock::now();
    try {
        for (const auto& entry : fs::recursive_directory_iterator(
                 cache_root_, fs::directory_options::skip_permission_denied)) {
            if (!entry.is_regular_file(ec)) {
                continue;
            }

            std::string key;
            if (!PathResolver::relativize(cache_root_, entry.path().string(), key)) {
                continue;
            }

            std::string name = entry.path().filename().string();
            auto time = entry.last_write_time(ec);
            if (ends_with(name, PREVIEW_SUFFIX)) {
                record(ArtifactKind::PREVIEW, key, time);
            } else if (ends_with(name, THUMBNAIL_SUFFIX)) {
                record(ArtifactKind::THUMBNAIL, key, time);
            } else if (AlbumCollageGenerator::is_collage_name(name)) {
                record(ArtifactKind::ALBUM, key, time);
            }
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("[ArtifactCache] Cache scan of {} incomplete: {}", cache_root_, e.what());
    }

    spdlog::info("[ArtifactCache] Loaded {} thumbnails, {} previews, {} album thumbnails in {} ms",
                 record_count(ArtifactKind::THUMBNAIL), record_count(ArtifactKind::PREVIEW),
                 record_count(ArtifactKind::ALBUM), elapsed_ms(start));
}

// ============================================================================
// Generation helpers
// ============================================================================

MediaError ArtifactCache::canonical_key(const std::string& artifact_relative, std::string& key,
                                        std::string& artifact_path) const {
    MediaError err = PathResolver::resolve(cache_root_, artifact_relative, artifact_path);
    if (!err) {
        return err;
    }
    return PathResolver::relativize(cache_root_, artifact_path, key);
}

MediaError ArtifactCache::resolve_artifact(const std::string& relative, std::string& key,
                                           std::string& source_path,
                                           std::string& artifact_path) const {
    MediaError err = PathResolver::resolve(media_root_, relative, source_path);
    if (!err) {
        return err;
    }
    std::string normalized;
    err = canonical_key(key, normalized, artifact_path);
    if (!err) {
        return err;
    }
    key = std::move(normalized);
    return MediaErrorHelper::success();
}

MediaError ArtifactCache::check_existing(ArtifactKind kind, const std::string& artifact_relative,
                                         const std::string& artifact_path, bool& present) {
    std::error_code ec;
    present = fs::exists(artifact_path, ec);
    if (present) {
        record(kind, artifact_relative, fs::last_write_time(artifact_path, ec));
        return MediaErrorHelper::success();
    }

    std::string marker = error_marker_name(artifact_path);
    if (fs::exists(marker, ec)) {
        return MediaErrorHelper::permanently_failed(marker, read_marker(marker));
    }
    return MediaErrorHelper::success();
}

MediaError ArtifactCache::fail(const MediaError& err, const std::string& artifact_path,
                               FailurePolicy policy) const {
    if (!err.is_memoizable() || policy != FailurePolicy::MEMOIZE) {
        spdlog::debug("[ArtifactCache] Not memoizing failure for {}: {}", artifact_path,
                      err.technical_msg);
        return err;
    }

    std::string marker = error_marker_name(artifact_path);
    std::ofstream file(marker, std::ios::trunc);
    if (file) {
        file << err.technical_msg;
    }
    if (!file) {
        spdlog::error("[ArtifactCache] Unable to write error marker {}", marker);
    }
    spdlog::warn("[ArtifactCache] Generation of {} failed ({}): {}", artifact_path,
                 media_result_to_string(err.result), err.technical_msg);
    return err;
}

MediaError ArtifactCache::ensure_parent_dir(const std::string& artifact_path) const {
    try {
        fs::create_directories(fs::path(artifact_path).parent_path());
    } catch (const fs::filesystem_error& e) {
        return MediaErrorHelper::io_error(e.what());
    }
    return MediaErrorHelper::success();
}

bool ArtifactCache::is_source_locked(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }

    struct flock lock {};
    lock.l_type = F_WRLCK;
    lock.l_whence = SEEK_SET;
    lock.l_start = 0;
    lock.l_len = 0;

    bool locked = fcntl(fd, F_GETLK, &lock) == 0 && lock.l_type != F_UNLCK;
    close(fd);
    return locked;
}

MediaError ArtifactCache::create_image_thumbnail(const std::string& source,
                                                 const std::string& target) {
    RgbaImage image;
    MediaError err = OrientationResolver::decode_upright(source, image);
    if (!err) {
        return err;
    }

    RgbaImage thumbnail =
        image_ops::fit_box(image, settings_.thumbnail_size, settings_.thumbnail_size);
    if (thumbnail.empty()) {
        return MediaErrorHelper::decode_error(source, "resize failed");
    }
    return image_ops::write_jpeg_file(thumbnail, target);
}

MediaError ArtifactCache::create_video_thumbnail(const std::string& source,
                                                 const std::string& target) {
    std::string frame_path = target + FRAME_SUFFIX;
    MediaError err = extractor_.extract_frame(source, frame_path);
    std::error_code ec;
    if (!err) {
        fs::remove(frame_path, ec);
        return err;
    }

    RgbaImage frame;
    err = image_ops::decode_file(frame_path, frame);
    fs::remove(frame_path, ec);
    if (!err) {
        return MediaErrorHelper::external_tool_error("Extracted frame unreadable: " +
                                                     err.technical_msg);
    }

    RgbaImage thumbnail =
        image_ops::fit_box(frame, settings_.thumbnail_size, settings_.thumbnail_size);
    if (thumbnail.empty()) {
        return MediaErrorHelper::decode_error(source, "resize failed");
    }

    const RgbaImage& icon = video_icon();
    image_ops::overlay(thumbnail, icon,
                       std::max(0, thumbnail.width - icon.width - VIDEO_ICON_MARGIN),
                       VIDEO_ICON_MARGIN);
    return image_ops::write_jpeg_file(thumbnail, target);
}

// ============================================================================
// Generation
// ============================================================================

MediaError ArtifactCache::generate_thumbnail(const std::string& relative,
                                             std::string& artifact_path, FailurePolicy policy) {
    MediaType type = MediaCatalog::classify(relative);
    if (type != MediaType::IMAGE && type != MediaType::VIDEO) {
        return MediaErrorHelper::unsupported_type(relative, "Thumbnail");
    }

    std::string key;
    MediaError err = thumbnail_name(relative, key);
    if (!err) {
        return err;
    }

    std::string source, target;
    err = resolve_artifact(relative, key, source, target);
    if (!err) {
        return err;
    }

    KeyedGate::Ticket ticket(gate_, key);

    bool present = false;
    err = check_existing(ArtifactKind::THUMBNAIL, key, target, present);
    if (!err || present) {
        if (present) {
            artifact_path = target;
        }
        return err;
    }

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return MediaErrorHelper::not_found(relative);
    }
    if (is_source_locked(source)) {
        return MediaErrorHelper::file_locked(relative);
    }
    err = ensure_parent_dir(target);
    if (!err) {
        return err;
    }

    spdlog::debug("[ArtifactCache] Creating new thumbnail for {}", relative);
    auto start = std::chrono::steady_clock::now();
    ++generation_attempts_;

    err = (type == MediaType::VIDEO) ? create_video_thumbnail(source, target)
                                     : create_image_thumbnail(source, target);
    if (!err) {
        return fail(err, target, policy);
    }

    record(ArtifactKind::THUMBNAIL, key, fs::last_write_time(target, ec));
    spdlog::debug("[ArtifactCache] Thumbnail {} created in {} ms", key, elapsed_ms(start));
    artifact_path = target;
    return MediaErrorHelper::success();
}

MediaError ArtifactCache::generate_preview(const std::string& relative,
                                           std::string& artifact_path, FailurePolicy policy) {
    if (MediaCatalog::classify(relative) != MediaType::IMAGE) {
        return MediaErrorHelper::unsupported_type(relative, "Preview");
    }

    std::string key;
    MediaError err = preview_name(relative, key);
    if (!err) {
        return err;
    }

    std::string source, target;
    err = resolve_artifact(relative, key, source, target);
    if (!err) {
        return err;
    }

    KeyedGate::Ticket ticket(gate_, key);

    bool present = false;
    err = check_existing(ArtifactKind::PREVIEW, key, target, present);
    if (!err || present) {
        if (present) {
            artifact_path = target;
        }
        return err;
    }

    std::error_code ec;
    if (!fs::exists(source, ec)) {
        return MediaErrorHelper::not_found(relative);
    }
    if (is_source_locked(source)) {
        return MediaErrorHelper::file_locked(relative);
    }
    err = ensure_parent_dir(target);
    if (!err) {
        return err;
    }

    int width = 0, height = 0;
    err = image_ops::read_dimensions(source, width, height);
    if (!err) {
        return fail(err, target, policy);
    }

    const int max_side = settings_.preview_max_side;
    if (width <= max_side && height <= max_side && !settings_.preview_small_images) {
        return MediaErrorHelper::too_small(relative, width, height);
    }

    spdlog::debug("[ArtifactCache] Creating new preview for {}", relative);
    auto start = std::chrono::steady_clock::now();
    ++generation_attempts_;

    RgbaImage image;
    err = OrientationResolver::decode_upright(source, image);
    if (!err) {
        return fail(err, target, policy);
    }

    RgbaImage preview = image_ops::fit_box(image, max_side, max_side);
    if (preview.empty()) {
        return fail(MediaErrorHelper::decode_error(relative, "resize failed"), target, policy);
    }
    err = image_ops::write_jpeg_file(preview, target);
    if (!err) {
        return fail(err, target, policy);
    }

    record(ArtifactKind::PREVIEW, key, fs::last_write_time(target, ec));
    spdlog::debug("[ArtifactCache] Preview {} created in {} ms", key, elapsed_ms(start));
    artifact_path = target;
    return MediaErrorHelper::success();
}

MediaError ArtifactCache::generate_album_thumbnail(
    const std::string& album_relative, const std::vector<std::string>& file_names,
    const AlbumCollageGenerator::ThumbnailProvider& provider, std::string& artifact_path) {
    std::string album_path;
    MediaError err = PathResolver::resolve(media_root_, album_relative, album_path);
    if (!err) {
        return err;
    }
    if (file_names.empty()) {
        return MediaErrorHelper::not_found(album_relative + " (no media files)");
    }

    std::string album_key;
    err = PathResolver::relativize(media_root_, album_path, album_key);
    if (!err) {
        return err;
    }
    std::string key = PathResolver::join(
        album_key,
        AlbumCollageGenerator::collage_name(PathResolver::base_name(album_key), file_names));

    std::string target;
    err = PathResolver::resolve(cache_root_, key, target);
    if (!err) {
        return err;
    }

    KeyedGate::Ticket ticket(gate_, key);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        record(ArtifactKind::ALBUM, key, fs::last_write_time(target, ec));
        artifact_path = target;
        return MediaErrorHelper::success();
    }

    err = ensure_parent_dir(target);
    if (!err) {
        return err;
    }

    spdlog::debug("[ArtifactCache] Creating album thumbnail {}", key);
    auto start = std::chrono::steady_clock::now();

    int tiles = 0;
    RgbaImage collage = AlbumCollageGenerator::compose(album_relative, file_names, provider, &tiles);
    err = image_ops::write_jpeg_file(collage, target);
    if (!err) {
        spdlog::warn("[ArtifactCache] Album thumbnail {} failed: {}", key, err.technical_msg);
        return err;
    }

    record(ArtifactKind::ALBUM, key, fs::last_write_time(target, ec));
    spdlog::debug("[ArtifactCache] Album thumbnail {} ({} tiles) created in {} ms", key, tiles,
                  elapsed_ms(start));
    artifact_path = target;
    return MediaErrorHelper::success();
}

// ============================================================================
// Maintenance
// ============================================================================

int ArtifactCache::cleanup_cache(const std::string& relative_dir,
                                 const std::vector<MediaEntry>& expected) {
    std::string cache_dir;
    if (!PathResolver::resolve(cache_root_, relative_dir, cache_dir)) {
        return 0;
    }

    std::error_code ec;
    if (!fs::is_directory(cache_dir, ec)) {
        return 0;
    }

    std::unordered_set<std::string> allowed;
    std::vector<std::string> media_files;
    for (const auto& entry : expected) {
        if (entry.type == MediaType::FOLDER) {
            allowed.insert(entry.name);
            continue;
        }
        media_files.push_back(entry.name);

        std::string name;
        if (thumbnail_name(entry.name, name)) {
            allowed.insert(name);
            allowed.insert(error_marker_name(name));
        }
        if (preview_name(entry.name, name)) {
            allowed.insert(name);
            allowed.insert(error_marker_name(name));
        }
    }

    std::string rel_dir;
    if (!PathResolver::relativize(cache_root_, cache_dir, rel_dir)) {
        return 0;
    }
    if (!media_files.empty()) {
        allowed.insert(
            AlbumCollageGenerator::collage_name(PathResolver::base_name(rel_dir), media_files));
    }

    int removed = 0;
    try {
        std::vector<fs::path> orphans;
        for (const auto& entry : fs::directory_iterator(cache_dir)) {
            if (allowed.count(entry.path().filename().string()) == 0) {
                orphans.push_back(entry.path());
            }
        }

        for (const auto& orphan : orphans) {
            std::string key = PathResolver::join(rel_dir, orphan.filename().string());
            spdlog::debug("[ArtifactCache] Removing orphan {}", key);
            fs::remove_all(orphan);
            for (auto kind : {ArtifactKind::THUMBNAIL, ArtifactKind::PREVIEW, ArtifactKind::ALBUM}) {
                forget(kind, key);
            }
            forget_prefix(key);
            ++removed;
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("[ArtifactCache] Cleanup of {} incomplete: {}", cache_dir, e.what());
    }
    return removed;
}

void ArtifactCache::remove_artifacts(const std::string& relative) {
    std::string names[2];
    if (!thumbnail_name(relative, names[0]) || !preview_name(relative, names[1])) {
        return;
    }

    const ArtifactKind kinds[2] = {ArtifactKind::THUMBNAIL, ArtifactKind::PREVIEW};
    for (int i = 0; i < 2; ++i) {
        std::string key, path;
        if (!canonical_key(names[i], key, path)) {
            return;
        }

        std::error_code ec;
        if (fs::remove(path, ec)) {
            spdlog::debug("[ArtifactCache] Removed {}", key);
        }
        fs::remove(error_marker_name(path), ec);
        forget(kinds[i], key);
    }
}

void ArtifactCache::remove_directory(const std::string& relative_dir) {
    std::string cache_dir;
    if (!PathResolver::resolve(cache_root_, relative_dir, cache_dir)) {
        return;
    }
    if (cache_dir == cache_root_) {
        spdlog::warn("[ArtifactCache] Refusing to remove the cache root");
        return;
    }

    std::string key;
    if (!PathResolver::relativize(cache_root_, cache_dir, key)) {
        return;
    }

    std::error_code ec;
    auto count = fs::remove_all(cache_dir, ec);
    if (ec) {
        spdlog::warn("[ArtifactCache] Failed to remove {}: {}", cache_dir, ec.message());
    } else if (count > 0) {
        spdlog::debug("[ArtifactCache] Removed cache directory {} ({} entries)", key, count);
    }
    forget_prefix(key);
}

} // namespace mediashelf
