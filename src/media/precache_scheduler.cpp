// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "precache_scheduler.h"

#include "exif_reader.h"
#include "path_resolver.h"

#include <hv/hthreadpool.h>
#include <spdlog/spdlog.h>

namespace mediashelf {

namespace {

/// Sets the flag for the lifetime of one sweep level and restores the old value
class ProgressScope {
  public:
    explicit ProgressScope(std::atomic<bool>& flag) : flag_(flag), previous_(flag.exchange(true)) {}
    ~ProgressScope() {
        flag_.store(previous_);
    }

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

  private:
    std::atomic<bool>& flag_;
    bool previous_;
};

} // namespace

PrecacheStatistics& PrecacheStatistics::operator+=(const PrecacheStatistics& other) {
    folders += other.folders;
    images += other.images;
    videos += other.videos;
    exif_thumbnails += other.exif_thumbnails;
    image_thumbnails += other.image_thumbnails;
    video_thumbnails += other.video_thumbnails;
    image_previews += other.image_previews;
    failed_folders += other.failed_folders;
    failed_image_thumbnails += other.failed_image_thumbnails;
    failed_video_thumbnails += other.failed_video_thumbnails;
    failed_image_previews += other.failed_image_previews;
    small_images += other.small_images;
    removed_cache_files += other.removed_cache_files;
    return *this;
}

PrecacheScheduler::PrecacheScheduler(ArtifactCache& cache, SweepOptions options)
    : cache_(cache), options_(options), worker_(std::make_unique<HThreadPool>(1, 1)) {
    worker_->start(1);
}

PrecacheScheduler::~PrecacheScheduler() {
    shutdown();
}

void PrecacheScheduler::shutdown() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (worker_) {
        worker_->wait();
        worker_->stop();
        worker_.reset();
    }
}

void PrecacheScheduler::wait_for_completion() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (worker_) {
        worker_->wait();
    }
}

PrecacheStatistics PrecacheScheduler::sweep(const std::string& relative, bool recursive,
                                            bool thumbnails, bool previews) {
    std::unique_lock<std::mutex> admission(sweep_mutex_, std::try_to_lock);
    if (!admission.owns_lock()) {
        spdlog::debug("[PrecacheScheduler] Waiting for the running sweep before '{}'", relative);
        admission.lock();
    }
    return sweep_level(relative, recursive, thumbnails, previews);
}

PrecacheStatistics PrecacheScheduler::sweep_level(const std::string& relative, bool recursive,
                                                  bool thumbnails, bool previews) {
    ProgressScope scope(in_progress_);

    PrecacheStatistics stats;
    std::vector<MediaEntry> entries;
    MediaError err = MediaCatalog::list(cache_.media_root(), relative, entries);
    if (!err) {
        spdlog::warn("[PrecacheScheduler] Unable to list '{}': {}", relative, err.technical_msg);
        stats.failed_folders = 1;
        return stats;
    }

    for (const auto& entry : entries) {
        if (entry.type == MediaType::FOLDER) {
            if (recursive) {
                stats.folders++;
                stats += sweep_level(entry.relative_path, true, thumbnails, previews);
            }
            continue;
        }

        const bool is_image = entry.type == MediaType::IMAGE;
        if (is_image) {
            stats.images++;
        } else {
            stats.videos++;
        }

        bool has_exif_thumb = false;
        if (!options_.ignore_exif_thumbs && MediaCatalog::is_jpeg(entry.name)) {
            std::string full_path;
            if (PathResolver::resolve(cache_.media_root(), entry.relative_path, full_path)) {
                auto exif = ExifReader::read_file(full_path);
                if (exif && exif->has_thumbnail()) {
                    stats.exif_thumbnails++;
                    has_exif_thumb = true;
                }
            }
        }

        std::string artifact;
        if (thumbnails && !has_exif_thumb && !cache_.has_thumbnail(entry.relative_path)) {
            err = cache_.generate_thumbnail(entry.relative_path, artifact);
            if (err) {
                (is_image ? stats.image_thumbnails : stats.video_thumbnails)++;
            } else {
                (is_image ? stats.failed_image_thumbnails : stats.failed_video_thumbnails)++;
            }
        }

        if (previews && is_image && !cache_.has_preview(entry.relative_path)) {
            err = cache_.generate_preview(entry.relative_path, artifact);
            if (err) {
                stats.image_previews++;
            } else if (err.result == MediaResult::TOO_SMALL_FOR_PREVIEW) {
                stats.small_images++;
            } else {
                stats.failed_image_previews++;
            }
        }
    }

    if (options_.enable_cleanup) {
        stats.removed_cache_files += cache_.cleanup_cache(relative, entries);
    }
    return stats;
}

bool PrecacheScheduler::start_async(bool thumbnails, bool previews, CompletionCallback on_done) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (!worker_) {
        spdlog::warn("[PrecacheScheduler] Worker is shut down, sweep not started");
        return false;
    }

    bool expected = false;
    if (!async_active_.compare_exchange_strong(expected, true)) {
        spdlog::info("[PrecacheScheduler] Precache already in progress");
        return false;
    }

    worker_->commit([this, thumbnails, previews, on_done]() {
        spdlog::info("[PrecacheScheduler] Pre-generating cache (thumbnails: {}, preview: {})",
                     thumbnails, previews);
        auto start = std::chrono::steady_clock::now();
        PrecacheStatistics stats = sweep("", true, thumbnails, previews);
        log_statistics(stats, std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start));
        async_active_.store(false);
        if (on_done) {
            on_done(stats);
        }
    });
    return true;
}

void PrecacheScheduler::log_statistics(const PrecacheStatistics& stats,
                                       std::chrono::milliseconds duration) {
    spdlog::info("[PrecacheScheduler] Pre-generation done in {:.1f} s", duration.count() / 1000.0);
    spdlog::info("[PrecacheScheduler]   folders: {} (failed {})", stats.folders,
                 stats.failed_folders);
    spdlog::info("[PrecacheScheduler]   images: {}, videos: {}, with EXIF thumbnail: {}",
                 stats.images, stats.videos, stats.exif_thumbnails);
    spdlog::info("[PrecacheScheduler]   image thumbnails: {} (failed {})", stats.image_thumbnails,
                 stats.failed_image_thumbnails);
    spdlog::info("[PrecacheScheduler]   video thumbnails: {} (failed {})", stats.video_thumbnails,
                 stats.failed_video_thumbnails);
    spdlog::info("[PrecacheScheduler]   previews: {} (failed {}, too small {})",
                 stats.image_previews, stats.failed_image_previews, stats.small_images);
    if (stats.removed_cache_files > 0) {
        spdlog::info("[PrecacheScheduler]   removed cache entries: {}", stats.removed_cache_files);
    }
}

} // namespace mediashelf
