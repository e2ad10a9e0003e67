// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "album_collage.h"

#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace mediashelf {

static constexpr uint64_t FNV64_OFFSET_BASIS = 14695981039346656037ULL;
static constexpr uint64_t FNV64_PRIME = 1099511628211ULL;

uint64_t AlbumCollageGenerator::fnv64(const std::string& data) {
    uint64_t hash = FNV64_OFFSET_BASIS;
    for (unsigned char c : data) {
        hash *= FNV64_PRIME;
        hash ^= c;
    }
    return hash;
}

std::string AlbumCollageGenerator::collage_name(const std::string& folder_name,
                                                const std::vector<std::string>& file_names) {
    std::string key = folder_name;
    for (const auto& name : file_names) {
        key += name;
    }
    return std::to_string(fnv64(key)) + ".jpg";
}

bool AlbumCollageGenerator::is_collage_name(const std::string& name) {
    static const std::string suffix = ".jpg";
    if (name.size() <= suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end() - suffix.size(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

RgbaImage AlbumCollageGenerator::compose(const std::string& album_relative,
                                         const std::vector<std::string>& file_names,
                                         const ThumbnailProvider& provider, int* tiles_used) {
    const bool small_grid = file_names.size() <= SMALL_GRID_MAX_FILES;
    const int grid = small_grid ? 2 : 3;
    const int cell = small_grid ? SMALL_GRID_CELL : LARGE_GRID_CELL;

    RgbaImage canvas = RgbaImage::filled(CANVAS_SIZE, CANVAS_SIZE, 0, 0, 0);

    int tile = 0;
    for (const auto& name : file_names) {
        if (tile >= grid * grid) {
            break;
        }

        std::string relative = PathResolver::join(album_relative, name);
        RgbaImage thumbnail;
        MediaError err = provider(relative, thumbnail);
        if (!err || thumbnail.empty()) {
            spdlog::debug("[AlbumCollage] Skipping {}: {}", relative, err.technical_msg);
            continue;
        }

        RgbaImage scaled = image_ops::resize_box(thumbnail, cell, cell);
        image_ops::paste(canvas, scaled, (tile % grid) * cell, (tile / grid) * cell);
        ++tile;
    }

    if (tiles_used) {
        *tiles_used = tile;
    }
    return canvas;
}

} // namespace mediashelf
