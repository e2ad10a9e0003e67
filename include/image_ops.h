// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "media_error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @file image_ops.h
 * @brief RGBA raster primitives backed by stb
 *
 * Decoding uses stb_image (PNG, JPEG, GIF first frame, BMP) and libtiff for
 * TIFF files, resizing uses stb_image_resize with a box filter and encoding
 * uses stb_image_write's baseline JPEG writer. All rasters are 8-bit RGBA,
 * row-major, no padding.
 */

namespace mediashelf {

struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    RgbaImage() = default;
    RgbaImage(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 0) {}

    [[nodiscard]] bool empty() const {
        return width <= 0 || height <= 0 || pixels.empty();
    }

    uint8_t* at(int x, int y) {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
    }

    const uint8_t* at(int x, int y) const {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
    }

    /// Solid image of one colour
    static RgbaImage filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
};

namespace image_ops {

/// JPEG quality used for every artifact
constexpr int JPEG_QUALITY = 90;

/// Decode a file, TIFF is recognized by its byte-order header
MediaError decode_file(const std::string& path, RgbaImage& out);

/// Decode an in-memory stb-supported image (no TIFF)
MediaError decode_memory(const uint8_t* data, size_t size, const std::string& label,
                         RgbaImage& out);

/**
 * @brief Read pixel dimensions from the image header without decoding
 */
MediaError read_dimensions(const std::string& path, int& width, int& height);

/// Box-filter resize to exactly @p width x @p height
RgbaImage resize_box(const RgbaImage& src, int width, int height);

/**
 * @brief Box-filter resize that fits inside @p max_width x @p max_height
 *
 * Preserves aspect ratio and never upscales: an image already inside the box
 * is returned unchanged.
 */
RgbaImage fit_box(const RgbaImage& src, int max_width, int max_height);

RgbaImage flip_horizontal(const RgbaImage& src);
RgbaImage flip_vertical(const RgbaImage& src);
RgbaImage rotate_180(const RgbaImage& src);
RgbaImage rotate_90_cw(const RgbaImage& src);
RgbaImage rotate_90_ccw(const RgbaImage& src);

/// Opaque copy of @p src into @p dst at (x, y), clipped to @p dst
void paste(RgbaImage& dst, const RgbaImage& src, int x, int y);

/// Alpha-blend @p src over @p dst at (x, y), clipped to @p dst
void overlay(RgbaImage& dst, const RgbaImage& src, int x, int y);

/**
 * @brief Encode as baseline JPEG
 *
 * Alpha is flattened onto black first.
 */
MediaError encode_jpeg(const RgbaImage& image, std::vector<uint8_t>& out,
                       int quality = JPEG_QUALITY);

/**
 * @brief Encode as JPEG and atomically place at @p path
 *
 * Writes `<path>.tmp` then renames it, so readers never observe a partially
 * written artifact.
 */
MediaError write_jpeg_file(const RgbaImage& image, const std::string& path,
                           int quality = JPEG_QUALITY);

} // namespace image_ops
} // namespace mediashelf
