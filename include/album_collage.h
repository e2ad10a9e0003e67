// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "image_ops.h"
#include "media_error.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mediashelf {

/**
 * @brief Composes per-item thumbnails of a folder into one album image
 *
 * Up to 4 files use a 2x2 grid of 128px cells, more use a 3x3 grid of 86px
 * cells, on a black 256x256 canvas. Cells are filled row-major; items whose
 * thumbnail cannot be produced are skipped and the remaining cells stay
 * black.
 */
class AlbumCollageGenerator {
  public:
    /// Produces the thumbnail of one media item (relative to the media root)
    using ThumbnailProvider =
        std::function<MediaError(const std::string& relative, RgbaImage& thumbnail)>;

    static constexpr int CANVAS_SIZE = 256;
    static constexpr int SMALL_GRID_CELL = 128;
    static constexpr int LARGE_GRID_CELL = 86;
    static constexpr size_t SMALL_GRID_MAX_FILES = 4;

    /// 64-bit FNV-1 hash
    static uint64_t fnv64(const std::string& data);

    /**
     * @brief Deterministic artifact name, `<decimal fnv64>.jpg`
     *
     * Hashes @p folder_name followed by the file names concatenated in order,
     * so any rename, addition or reordering yields a new name.
     */
    static std::string collage_name(const std::string& folder_name,
                                    const std::vector<std::string>& file_names);

    /// True for names of the form `<digits>.jpg`
    static bool is_collage_name(const std::string& name);

    /**
     * @brief Render the collage
     * @param album_relative Folder relative to the media root
     * @param file_names Media file names inside the folder, in listing order
     * @param provider Per-item thumbnail source
     * @param tiles_used Output (optional): number of filled cells
     */
    static RgbaImage compose(const std::string& album_relative,
                             const std::vector<std::string>& file_names,
                             const ThumbnailProvider& provider, int* tiles_used = nullptr);
};

} // namespace mediashelf
