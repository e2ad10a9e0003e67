// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Filesystem sandbox and media fixture writers for unit tests
 *
 * Fixture media is synthesized at test time through the library's own
 * encoder, so no binary test assets are checked in.
 *
 * Usage:
 * @code
 * TEST_CASE("...", "[tags]") {
 *     TempDir tmp;
 *     write_test_jpeg(tmp.media("a/photo.jpg"), 640, 480);
 *     ArtifactCache cache(tmp.media_root(), tmp.cache_root());
 * }
 * @endcode
 */

#include "image_ops.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mediashelf {
namespace test {

/**
 * @brief RAII temporary directory with `media/` and `cache/` sub-trees
 */
class TempDir {
  public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const {
        return path_;
    }

    std::string media_root() const;
    std::string cache_root() const;

    /// Absolute path of @p relative under the media root, parent directories created
    std::string media(const std::string& relative) const;

    /// Absolute path of @p relative under the cache root (nothing created)
    std::string cache(const std::string& relative) const;

  private:
    std::string path_;
};

/// Solid-color image
RgbaImage solid_image(int width, int height, uint8_t r, uint8_t g, uint8_t b);

/// Image split in four solid quadrants (tl, tr, bl, br as 0xRRGGBB)
RgbaImage quadrant_image(int width, int height, uint32_t tl, uint32_t tr, uint32_t bl,
                         uint32_t br);

/**
 * @brief Build a JPEG with an optional EXIF APP1 segment
 *
 * @param orientation IFD0 orientation tag, omitted when nullopt
 * @param thumbnail Embedded IFD1 JPEG thumbnail, omitted when empty
 */
std::vector<uint8_t> make_jpeg(const RgbaImage& image, std::optional<int> orientation = {},
                               const std::vector<uint8_t>& thumbnail = {});

/// Insert a raw TIFF block as an "Exif" APP1 segment right after SOI
std::vector<uint8_t> insert_exif_block(const std::vector<uint8_t>& plain_jpeg,
                                       const std::vector<uint8_t>& tiff);

/// JPEG-encode a solid thumbnail suitable for embedding
std::vector<uint8_t> make_thumbnail_jpeg(int width, int height);

void write_bytes(const std::string& path, const std::vector<uint8_t>& data);
void write_text(const std::string& path, const std::string& text);

/// Plain JPEG, no EXIF
void write_test_jpeg(const std::string& path, int width, int height);

/// PNG written through stb_image_write
void write_test_png(const std::string& path, int width, int height);

/// RGB TIFF written through libtiff, top half red and bottom half blue
void write_test_tiff(const std::string& path, int width, int height);

/// JPEG carrying an embedded EXIF thumbnail
void write_test_jpeg_with_thumbnail(const std::string& path, int width, int height);

/// File with an image extension but garbage content
void write_corrupt_image(const std::string& path);

/// Dimensions of an image file, {0, 0} if unreadable
std::pair<int, int> image_size(const std::string& path);

/**
 * @brief Write lock on a file held by a forked child process
 *
 * fcntl locks held by the test process itself are invisible to F_GETLK in
 * the same process, so the lock has to come from another one. The child keeps
 * the lock until release() or destruction.
 */
class ForeignLock {
  public:
    explicit ForeignLock(const std::string& path);
    ~ForeignLock();

    ForeignLock(const ForeignLock&) = delete;
    ForeignLock& operator=(const ForeignLock&) = delete;

    /// True once the child has acquired the lock
    bool held() const {
        return held_;
    }

    /// Let the child drop the lock and exit, then reap it
    void release();

  private:
    int pid_ = -1;
    int release_fd_ = -1;
    bool held_ = false;
};

/// Poll @p condition until true or @p timeout expires
bool wait_for(const std::function<bool()>& condition,
              std::chrono::milliseconds timeout = std::chrono::seconds(10));

} // namespace test
} // namespace mediashelf
