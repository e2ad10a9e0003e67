// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "album_collage.h"
#include "frame_extractor.h"
#include "image_ops.h"
#include "media_catalog.h"
#include "media_error.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * @file artifact_cache.h
 * @brief Derived artifact store mirrored under the cache root
 *
 * ArtifactCache owns every file under the cache root: thumbnails, previews,
 * album collages and the error markers that memoize permanent failures.
 * For a source `dir/img.png` the artifacts are:
 * - `dir/img.thumb.jpg`  (256x256 box, aspect preserved)
 * - `dir/img.preview.jpg` (max side from settings, never upscaled)
 * - `dir/img.thumb.err.txt` / `dir/img.preview.err.txt` after a permanent failure
 * - `dir/<fnv64>.jpg` for the album collage of `dir`
 *
 * Per artifact key the state is absent, present or permanently failed. A
 * present artifact is returned as is, a failed one fails immediately until
 * its marker is removed.
 *
 * Thread safety: all public methods may be called concurrently. The record
 * index is mutex-guarded and generation is serialized per artifact key, so a
 * sweep and a live request racing on the same file transcode it once.
 */

namespace mediashelf {

enum class ArtifactKind { THUMBNAIL = 0, PREVIEW = 1, ALBUM = 2 };

/**
 * @brief What to do with a memoizable failure
 */
enum class FailurePolicy {
    MEMOIZE, ///< Write an error marker (on-demand requests, sweeps, last watcher attempt)
    RETRY,   ///< Report only, the caller will try again later
};

struct ArtifactCacheSettings {
    int thumbnail_size = 256;
    int preview_max_side = 1280;
    bool preview_small_images = false;
    std::string extractor_command = FrameExtractor::DEFAULT_COMMAND;
    std::chrono::milliseconds extract_timeout = std::chrono::seconds(30);
};

/**
 * @brief Blocks concurrent holders of the same key
 */
class KeyedGate {
  public:
    class Ticket {
      public:
        Ticket(KeyedGate& gate, std::string key);
        ~Ticket();

        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

      private:
        KeyedGate& gate_;
        std::string key_;
    };

  private:
    friend class Ticket;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> active_;
};

class ArtifactCache {
  public:
    static constexpr const char* THUMBNAIL_SUFFIX = ".thumb.jpg";
    static constexpr const char* PREVIEW_SUFFIX = ".preview.jpg";
    static constexpr const char* ERROR_MARKER_EXT = ".err.txt";
    static constexpr const char* FRAME_SUFFIX = ".sh.jpg";

    static constexpr int VIDEO_ICON_SIZE = 90;
    static constexpr int VIDEO_ICON_MARGIN = 11;

    using RecordTime = std::filesystem::file_time_type;

    ArtifactCache(std::string media_root, std::string cache_root,
                  ArtifactCacheSettings settings = {});

    ArtifactCache(const ArtifactCache&) = delete;
    ArtifactCache& operator=(const ArtifactCache&) = delete;

    // ========================================================================
    // Naming
    // ========================================================================

    /// `a/b.png` -> `a/b.thumb.jpg`, NO_EXTENSION if the name has none
    static MediaError thumbnail_name(const std::string& relative, std::string& out);

    /// `a/b.png` -> `a/b.preview.jpg`, NO_EXTENSION if the name has none
    static MediaError preview_name(const std::string& relative, std::string& out);

    /// `a/b.thumb.jpg` -> `a/b.thumb.err.txt`
    static std::string error_marker_name(const std::string& artifact);

    // ========================================================================
    // Generation
    // ========================================================================

    /**
     * @brief Return the thumbnail of a media file, generating it if needed
     *
     * @param relative Media file relative to the media root
     * @param artifact_path Output: absolute path of the thumbnail
     * @param policy Whether a payload failure writes an error marker
     */
    MediaError generate_thumbnail(const std::string& relative, std::string& artifact_path,
                                  FailurePolicy policy = FailurePolicy::MEMOIZE);

    /**
     * @brief Return the preview of an image, generating it if needed
     *
     * Returns TOO_SMALL_FOR_PREVIEW (never memoized) when the image already
     * fits the preview box and small-image previews are disabled.
     */
    MediaError generate_preview(const std::string& relative, std::string& artifact_path,
                                FailurePolicy policy = FailurePolicy::MEMOIZE);

    /**
     * @brief Return the collage for a folder, generating it if needed
     *
     * @param album_relative Folder relative to the media root
     * @param file_names Media file names of the folder in listing order
     * @param provider Per-item thumbnail source used for the cells
     * @param artifact_path Output: absolute path of the collage
     */
    MediaError generate_album_thumbnail(const std::string& album_relative,
                                        const std::vector<std::string>& file_names,
                                        const AlbumCollageGenerator::ThumbnailProvider& provider,
                                        std::string& artifact_path);

    // ========================================================================
    // Index and maintenance
    // ========================================================================

    /// Scan the whole cache tree and rebuild the record index
    void load_cache();

    [[nodiscard]] bool has_thumbnail(const std::string& relative) const;
    [[nodiscard]] bool has_preview(const std::string& relative) const;
    [[nodiscard]] bool has_album_thumbnail(const std::string& collage_relative) const;
    [[nodiscard]] size_t record_count(ArtifactKind kind) const;

    /**
     * @brief Delete cache residents of one directory level not backed by a source
     *
     * Keeps sub-folder names, the thumbnail/preview names of listed files and
     * their error markers, and the current collage of the directory.
     *
     * @param relative_dir Directory relative to both roots
     * @param expected Current MediaCatalog listing of that directory
     * @return Number of removed entries
     */
    int cleanup_cache(const std::string& relative_dir, const std::vector<MediaEntry>& expected);

    /// Remove thumbnail, preview and error markers of a media file
    void remove_artifacts(const std::string& relative);

    /// Remove the cache subtree mirroring a media directory
    void remove_directory(const std::string& relative_dir);

    /// True if another process holds a lock on @p path
    static bool is_source_locked(const std::string& path);

    /// Number of times the decode/extract path has actually been entered
    [[nodiscard]] size_t generation_attempts() const {
        return generation_attempts_.load();
    }

    [[nodiscard]] bool has_video_support() const;

    /// Badge drawn on video thumbnails, built once on first use
    const RgbaImage& video_icon() const;

    const std::string& media_root() const {
        return media_root_;
    }

    const std::string& cache_root() const {
        return cache_root_;
    }

    const ArtifactCacheSettings& settings() const {
        return settings_;
    }

  private:
    /// Cache path of @p artifact_relative and its normalized key ("./a//b" -> "a/b")
    MediaError canonical_key(const std::string& artifact_relative, std::string& key,
                             std::string& artifact_path) const;

    /// Resolve source and artifact paths; @p key is normalized in place
    MediaError resolve_artifact(const std::string& relative, std::string& key,
                                std::string& source_path, std::string& artifact_path) const;
    MediaError check_existing(ArtifactKind kind, const std::string& artifact_relative,
                              const std::string& artifact_path, bool& present);
    MediaError fail(const MediaError& err, const std::string& artifact_path,
                    FailurePolicy policy) const;
    MediaError ensure_parent_dir(const std::string& artifact_path) const;

    MediaError create_image_thumbnail(const std::string& source, const std::string& target);
    MediaError create_video_thumbnail(const std::string& source, const std::string& target);

    void record(ArtifactKind kind, const std::string& key, RecordTime time);
    void forget(ArtifactKind kind, const std::string& key);
    void forget_prefix(const std::string& relative_dir);
    [[nodiscard]] bool is_recorded(ArtifactKind kind, const std::string& key) const;

    const std::string media_root_;
    const std::string cache_root_;
    const ArtifactCacheSettings settings_;
    const FrameExtractor extractor_;

    mutable std::mutex records_mutex_;
    std::unordered_map<std::string, RecordTime> records_[3];

    KeyedGate gate_;
    std::atomic<size_t> generation_attempts_{0};

    mutable std::once_flag video_icon_once_;
    mutable RgbaImage video_icon_;
};

} // namespace mediashelf
