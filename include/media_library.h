// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "artifact_cache.h"
#include "directory_watcher.h"
#include "media_catalog.h"
#include "media_error.h"
#include "media_settings.h"
#include "precache_scheduler.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

/**
 * @file media_library.h
 * @brief Entry points used by the serving layer
 *
 * MediaLibrary wires the catalog, the artifact cache, the precache scheduler
 * and the directory watcher together for one media root. Request handlers
 * only talk to this class; every `write_*` call streams JPEG bytes into the
 * given stream or leaves it untouched and returns the error.
 */

namespace mediashelf {

class MediaLibrary : public WatchListener {
  public:
    explicit MediaLibrary(MediaSettings settings, WatcherSettings watcher_settings = {});
    ~MediaLibrary() override;

    MediaLibrary(const MediaLibrary&) = delete;
    MediaLibrary& operator=(const MediaLibrary&) = delete;

    /**
     * @brief Load the cache index, kick off the startup sweep, start the watcher
     */
    MediaError start();

    /// Stop the watcher and wait for a running sweep
    void stop();

    MediaError list_directory(const std::string& relative, std::vector<MediaEntry>& entries) const;

    /**
     * @brief Stream the thumbnail of an image or video
     *
     * Prefers the embedded EXIF thumbnail of a JPEG (unless ignored in
     * settings), then the cached or freshly generated artifact.
     */
    MediaError write_thumbnail(std::ostream& out, const std::string& relative);

    /// Stream the preview of an image, DISABLED when previews are off
    MediaError write_preview(std::ostream& out, const std::string& relative);

    /**
     * @brief Stream the embedded EXIF thumbnail of a JPEG
     *
     * The thumbnail is re-encoded upright when the file's orientation
     * requires it. An orientation-tagged thumbnail that fails to decode is
     * streamed as stored.
     *
     * @return NOT_FOUND when the file has no embedded thumbnail
     */
    MediaError write_exif_thumbnail(std::ostream& out, const std::string& relative);

    /// False for non-JPEG files, for upright files, and when auto-rotation is off
    [[nodiscard]] bool is_rotation_needed(const std::string& relative) const;

    /// Stream the full image, corrected to upright orientation
    MediaError rotate_and_write(std::ostream& out, const std::string& relative);

    /// Stream the collage of a folder's media files
    MediaError write_album_thumbnail(std::ostream& out, const std::string& relative_folder);

    [[nodiscard]] bool is_precache_in_progress() const;

    /// Synchronous sweep, see PrecacheScheduler::sweep()
    PrecacheStatistics sweep(const std::string& relative, bool recursive, bool thumbnails,
                             bool previews);

    ArtifactCache& cache() {
        return cache_;
    }

    const MediaSettings& settings() const {
        return settings_;
    }

    /// Null when the watcher is disabled or not started
    const DirectoryWatcher* watcher() const {
        return watcher_.get();
    }

    // WatchListener
    MediaError on_file_added(const std::string& relative, FailurePolicy policy,
                             bool replaced) override;
    void on_file_removed(const std::string& relative) override;
    void on_directory_removed(const std::string& relative) override;

  private:
    MediaError stream_file(std::ostream& out, const std::string& path) const;
    MediaError album_cell(const std::string& relative, RgbaImage& out);

    const MediaSettings settings_;
    const WatcherSettings watcher_settings_;
    ArtifactCache cache_;
    PrecacheScheduler scheduler_;
    std::unique_ptr<DirectoryWatcher> watcher_;
};

} // namespace mediashelf
