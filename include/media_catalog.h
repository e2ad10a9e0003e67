// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "media_error.h"

#include <string>
#include <vector>

namespace mediashelf {

enum class MediaType { FOLDER, IMAGE, VIDEO, UNSUPPORTED };

const char* media_type_to_string(MediaType type);

/**
 * @brief One listed directory entry
 */
struct MediaEntry {
    MediaType type = MediaType::UNSUPPORTED;
    std::string name;          ///< File or folder name
    std::string relative_path; ///< Slash-separated path from the media root
};

/**
 * @brief Directory listing and extension-based media classification
 *
 * The type set is fixed: `.png .jpg .jpeg .tif .tiff .gif` are images and
 * `.avi .mov .vid .mkv .mp4` are videos, matched case-insensitively.
 */
class MediaCatalog {
  public:
    /**
     * @brief List one directory level beneath @p root
     *
     * Directories and symbolic links are reported as folders. Unsupported
     * files are skipped. Entries are sorted by name.
     *
     * @param root Media root
     * @param relative Directory relative to @p root ("" for the root itself)
     * @param entries Output: entries, only assigned on success
     * @return PATH_ESCAPE, NOT_FOUND or IO_ERROR on failure
     */
    static MediaError list(const std::string& root, const std::string& relative,
                           std::vector<MediaEntry>& entries);

    /// Classify a file name by extension (never returns FOLDER)
    static MediaType classify(const std::string& name);

    /// Lower-cased extension including the dot, empty if none
    static std::string extension(const std::string& name);

    static bool is_image(const std::string& name) {
        return classify(name) == MediaType::IMAGE;
    }

    /// True for names carrying EXIF metadata (.jpg / .jpeg)
    static bool is_jpeg(const std::string& name);
};

} // namespace mediashelf
