// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "artifact_cache.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

class HThreadPool;

namespace mediashelf {

/**
 * @brief Counters collected by a precache sweep
 *
 * Child directories are folded into the parent's totals, so the value
 * returned for the root covers the whole walked tree exactly once.
 */
struct PrecacheStatistics {
    int folders = 0;
    int images = 0;
    int videos = 0;
    int exif_thumbnails = 0;
    int image_thumbnails = 0;
    int video_thumbnails = 0;
    int image_previews = 0;
    int failed_folders = 0;
    int failed_image_thumbnails = 0;
    int failed_video_thumbnails = 0;
    int failed_image_previews = 0;
    int small_images = 0;
    int removed_cache_files = 0;

    PrecacheStatistics& operator+=(const PrecacheStatistics& other);
};

struct SweepOptions {
    bool ignore_exif_thumbs = false;
    bool enable_cleanup = false;
};

/**
 * @brief Walks the media tree and drives the ArtifactCache for every file
 *
 * At most one asynchronous sweep runs at a time on a single-worker pool.
 * sweep() itself is synchronous and may also be called directly. Top-level
 * sweeps are admitted one at a time, so a direct call made while another
 * sweep runs waits for it; the in-progress flag is saved and restored around
 * every directory level.
 */
class PrecacheScheduler {
  public:
    using CompletionCallback = std::function<void(const PrecacheStatistics&)>;

    PrecacheScheduler(ArtifactCache& cache, SweepOptions options);
    ~PrecacheScheduler();

    PrecacheScheduler(const PrecacheScheduler&) = delete;
    PrecacheScheduler& operator=(const PrecacheScheduler&) = delete;

    /**
     * @brief Process one directory, optionally descending into sub-folders
     *
     * Blocks until any other running sweep has finished.
     *
     * @param relative Directory relative to the media root ("" for the root)
     * @param recursive Descend into sub-folders
     * @param thumbnails Generate missing thumbnails
     * @param previews Generate missing previews
     */
    PrecacheStatistics sweep(const std::string& relative, bool recursive, bool thumbnails,
                             bool previews);

    /**
     * @brief Run a full recursive sweep on the background worker
     *
     * @return false if a background sweep is already queued or running
     */
    bool start_async(bool thumbnails, bool previews, CompletionCallback on_done = nullptr);

    /// True while a sweep runs or a background sweep is queued
    [[nodiscard]] bool is_in_progress() const {
        return in_progress_.load() || async_active_.load();
    }

    /// Block until the background worker is idle
    void wait_for_completion();

    /// Stop the background worker (waits for a running sweep to finish)
    void shutdown();

    /// Log the totals of a finished sweep
    static void log_statistics(const PrecacheStatistics& stats,
                               std::chrono::milliseconds duration);

  private:
    PrecacheStatistics sweep_level(const std::string& relative, bool recursive, bool thumbnails,
                                   bool previews);

    ArtifactCache& cache_;
    const SweepOptions options_;

    std::atomic<bool> in_progress_{false};
    std::atomic<bool> async_active_{false};

    std::mutex sweep_mutex_; ///< Admits one top-level sweep at a time

    std::mutex pool_mutex_;
    std::unique_ptr<HThreadPool> worker_;
};

} // namespace mediashelf
