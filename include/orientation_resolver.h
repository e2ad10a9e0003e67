// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "image_ops.h"

#include <optional>
#include <string>

namespace mediashelf {

/**
 * @brief Geometric correction required by an EXIF orientation code
 */
enum class OrientationTransform {
    NONE,           ///< 1 or absent
    FLIP_H,         ///< 2: mirrored left-right
    ROTATE_180,     ///< 3
    FLIP_V,         ///< 4: 180° + mirror, equal to a top-bottom flip
    TRANSPOSE,      ///< 5: top-bottom flip, then 270° counter-clockwise
    ROTATE_90_CW,   ///< 6: 270° counter-clockwise
    TRANSVERSE,     ///< 7: top-bottom flip, then 90° counter-clockwise
    ROTATE_90_CCW,  ///< 8: 90° counter-clockwise
};

/**
 * @brief Decides whether an image must be rotated for upright display
 *
 * Only JPEG files carry orientation metadata. Every other format reports
 * "no rotation needed".
 */
class OrientationResolver {
  public:
    static OrientationTransform transform_for(int orientation_code);
    static const char* transform_name(OrientationTransform transform);

    /// Orientation code of a JPEG file, nullopt for other formats or missing tag
    static std::optional<int> orientation_code(const std::string& path);

    /// True when the file's orientation code is 2..8
    static bool needs_rotation(const std::string& path);

    /// Apply the correction for @p orientation_code
    static RgbaImage apply(const RgbaImage& image, int orientation_code);

    /**
     * @brief Decode a file and, for JPEG, correct it to upright orientation
     */
    static MediaError decode_upright(const std::string& path, RgbaImage& out);
};

} // namespace mediashelf
