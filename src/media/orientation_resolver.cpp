// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "orientation_resolver.h"

#include "exif_reader.h"
#include "media_catalog.h"

#include <spdlog/spdlog.h>

namespace mediashelf {

OrientationTransform OrientationResolver::transform_for(int orientation_code) {
    switch (orientation_code) {
    case 2:
        return OrientationTransform::FLIP_H;
    case 3:
        return OrientationTransform::ROTATE_180;
    case 4:
        return OrientationTransform::FLIP_V;
    case 5:
        return OrientationTransform::TRANSPOSE;
    case 6:
        return OrientationTransform::ROTATE_90_CW;
    case 7:
        return OrientationTransform::TRANSVERSE;
    case 8:
        return OrientationTransform::ROTATE_90_CCW;
    default:
        return OrientationTransform::NONE;
    }
}

const char* OrientationResolver::transform_name(OrientationTransform transform) {
    switch (transform) {
    case OrientationTransform::NONE:
        return "none";
    case OrientationTransform::FLIP_H:
        return "flip-h";
    case OrientationTransform::ROTATE_180:
        return "rotate-180";
    case OrientationTransform::FLIP_V:
        return "flip-v";
    case OrientationTransform::TRANSPOSE:
        return "transpose";
    case OrientationTransform::ROTATE_90_CW:
        return "rotate-90-cw";
    case OrientationTransform::TRANSVERSE:
        return "transverse";
    case OrientationTransform::ROTATE_90_CCW:
        return "rotate-90-ccw";
    }
    return "unknown";
}

std::optional<int> OrientationResolver::orientation_code(const std::string& path) {
    if (!MediaCatalog::is_jpeg(path)) {
        return std::nullopt;
    }
    auto exif = ExifReader::read_file(path);
    if (!exif) {
        return std::nullopt;
    }
    return exif->orientation;
}

bool OrientationResolver::needs_rotation(const std::string& path) {
    auto code = orientation_code(path);
    return code && transform_for(*code) != OrientationTransform::NONE;
}

RgbaImage OrientationResolver::apply(const RgbaImage& image, int orientation_code) {
    switch (transform_for(orientation_code)) {
    case OrientationTransform::FLIP_H:
        return image_ops::flip_horizontal(image);
    case OrientationTransform::ROTATE_180:
        return image_ops::rotate_180(image);
    case OrientationTransform::FLIP_V:
        return image_ops::flip_vertical(image);
    case OrientationTransform::TRANSPOSE:
        return image_ops::rotate_90_cw(image_ops::flip_vertical(image));
    case OrientationTransform::ROTATE_90_CW:
        return image_ops::rotate_90_cw(image);
    case OrientationTransform::TRANSVERSE:
        return image_ops::rotate_90_ccw(image_ops::flip_vertical(image));
    case OrientationTransform::ROTATE_90_CCW:
        return image_ops::rotate_90_ccw(image);
    case OrientationTransform::NONE:
        break;
    }
    return image;
}

MediaError OrientationResolver::decode_upright(const std::string& path, RgbaImage& out) {
    MediaError err = image_ops::decode_file(path, out);
    if (!err) {
        return err;
    }

    auto code = orientation_code(path);
    if (code && transform_for(*code) != OrientationTransform::NONE) {
        spdlog::trace("[OrientationResolver] {} orientation {} -> {}", path, *code,
                      transform_name(transform_for(*code)));
        out = apply(out, *code);
    }
    return MediaErrorHelper::success();
}

} // namespace mediashelf
