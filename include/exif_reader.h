// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file exif_reader.h
 * @brief EXIF metadata lookup for JPEG files
 *
 * Thin wrapper over Exiv2. Only two things are extracted: the
 * Exif.Image.Orientation tag and the IFD1 embedded JPEG thumbnail. Anything
 * that is not a JPEG reports no metadata.
 */

namespace mediashelf {

struct ExifData {
    std::optional<int> orientation; ///< 1..8, absent when the tag is missing or invalid
    std::vector<uint8_t> thumbnail; ///< Embedded JPEG thumbnail, empty if none

    [[nodiscard]] bool has_thumbnail() const {
        return !thumbnail.empty();
    }
};

class ExifReader {
  public:
    /**
     * @brief Parse EXIF metadata from an in-memory JPEG
     * @return Metadata, or nullopt when the data is not a JPEG or has no EXIF block
     */
    static std::optional<ExifData> parse(const uint8_t* data, size_t size);

    /**
     * @brief Parse EXIF metadata from a JPEG file
     *
     * Exiv2 stops at the start of scan, the entropy-coded data is never read.
     */
    static std::optional<ExifData> read_file(const std::string& path);
};

} // namespace mediashelf
