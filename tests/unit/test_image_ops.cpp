// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "image_ops.h"
#include "test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <climits>
#include <filesystem>

using namespace mediashelf;
using namespace mediashelf::test;

namespace fs = std::filesystem;

namespace {

/// 3x2 image with a distinct red value per pixel: r = 10 * (y * 3 + x)
RgbaImage indexed_image() {
    RgbaImage image(3, 2);
    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            uint8_t* px = image.at(x, y);
            px[0] = static_cast<uint8_t>(10 * (y * 3 + x));
            px[3] = 255;
        }
    }
    return image;
}

int red(const RgbaImage& image, int x, int y) {
    return image.at(x, y)[0];
}

} // namespace

TEST_CASE("ImageOps: fit_box preserves aspect ratio", "[image]") {
    SECTION("wide source") {
        RgbaImage out = image_ops::fit_box(solid_image(400, 100, 1, 2, 3), 200, 200);
        REQUIRE(out.width == 200);
        REQUIRE(out.height == 50);
    }

    SECTION("tall source") {
        RgbaImage out = image_ops::fit_box(solid_image(100, 400, 1, 2, 3), 200, 200);
        REQUIRE(out.width == 50);
        REQUIRE(out.height == 200);
    }

    SECTION("never upscales") {
        RgbaImage out = image_ops::fit_box(solid_image(120, 80, 1, 2, 3), 200, 200);
        REQUIRE(out.width == 120);
        REQUIRE(out.height == 80);
    }

    SECTION("extreme aspect keeps at least one pixel") {
        RgbaImage out = image_ops::fit_box(solid_image(4000, 2, 1, 2, 3), 200, 200);
        REQUIRE(out.width == 200);
        REQUIRE(out.height == 1);
    }
}

TEST_CASE("ImageOps: box resize keeps solid colors", "[image]") {
    RgbaImage out = image_ops::resize_box(solid_image(64, 64, 100, 150, 200), 16, 16);
    REQUIRE(out.width == 16);
    REQUIRE(out.height == 16);
    const uint8_t* px = out.at(8, 8);
    REQUIRE(px[0] == 100);
    REQUIRE(px[1] == 150);
    REQUIRE(px[2] == 200);
}

TEST_CASE("ImageOps: flips and rotations", "[image]") {
    RgbaImage src = indexed_image();

    SECTION("flip horizontal") {
        RgbaImage out = image_ops::flip_horizontal(src);
        REQUIRE(red(out, 0, 0) == 20);
        REQUIRE(red(out, 2, 1) == 30);
    }

    SECTION("flip vertical") {
        RgbaImage out = image_ops::flip_vertical(src);
        REQUIRE(red(out, 0, 0) == 30);
        REQUIRE(red(out, 2, 1) == 20);
    }

    SECTION("rotate 180") {
        RgbaImage out = image_ops::rotate_180(src);
        REQUIRE(red(out, 0, 0) == 50);
        REQUIRE(red(out, 2, 1) == 0);
    }

    SECTION("rotate 90 clockwise") {
        RgbaImage out = image_ops::rotate_90_cw(src);
        REQUIRE(out.width == 2);
        REQUIRE(out.height == 3);
        // Bottom-left of the source ends up top-left
        REQUIRE(red(out, 0, 0) == 30);
        REQUIRE(red(out, 1, 0) == 0);
        REQUIRE(red(out, 1, 2) == 20);
    }

    SECTION("rotate 90 counter-clockwise") {
        RgbaImage out = image_ops::rotate_90_ccw(src);
        REQUIRE(out.width == 2);
        REQUIRE(out.height == 3);
        // Top-right of the source ends up top-left
        REQUIRE(red(out, 0, 0) == 20);
        REQUIRE(red(out, 0, 2) == 0);
        REQUIRE(red(out, 1, 2) == 30);
    }

    SECTION("cw then ccw is identity") {
        RgbaImage out = image_ops::rotate_90_ccw(image_ops::rotate_90_cw(src));
        REQUIRE(out.pixels == src.pixels);
    }
}

TEST_CASE("ImageOps: paste and overlay clip to the destination", "[image]") {
    RgbaImage dst = solid_image(4, 4, 0, 0, 0);

    SECTION("paste") {
        image_ops::paste(dst, solid_image(4, 4, 255, 255, 255), 2, 2);
        REQUIRE(dst.at(1, 1)[0] == 0);
        REQUIRE(dst.at(2, 2)[0] == 255);
        REQUIRE(dst.at(3, 3)[0] == 255);
    }

    SECTION("overlay blends by alpha") {
        RgbaImage half = RgbaImage::filled(2, 2, 255, 255, 255, 128);
        image_ops::overlay(dst, half, -1, -1);
        REQUIRE(dst.at(0, 0)[0] == 128);
        REQUIRE(dst.at(1, 1)[0] == 0);
    }
}

TEST_CASE("ImageOps: decode errors", "[image]") {
    TempDir tmp;
    RgbaImage image;

    SECTION("missing file") {
        MediaError err = image_ops::decode_file(tmp.media_root() + "/missing.png", image);
        REQUIRE(err.result == MediaResult::NOT_FOUND);
    }

    SECTION("garbage content") {
        write_corrupt_image(tmp.media("bad.png"));
        MediaError err = image_ops::decode_file(tmp.media("bad.png"), image);
        REQUIRE(err.result == MediaResult::DECODE_ERROR);
        REQUIRE(err.is_memoizable());
    }

    SECTION("empty file") {
        write_text(tmp.media("empty.jpg"), "");
        MediaError err = image_ops::decode_file(tmp.media("empty.jpg"), image);
        REQUIRE(err.result == MediaResult::DECODE_ERROR);
    }

    SECTION("TIFF header without a directory") {
        write_bytes(tmp.media("stub.tif"), {'I', 'I', 0x2A, 0x00, 0xFF, 0xFF, 0, 0});
        MediaError err = image_ops::decode_file(tmp.media("stub.tif"), image);
        REQUIRE(err.result == MediaResult::DECODE_ERROR);
    }

    SECTION("buffers beyond the decoder's size range") {
        const uint8_t byte = 0xFF;
        const size_t huge = static_cast<size_t>(INT_MAX) + 1;
        MediaError err = image_ops::decode_memory(&byte, huge, "huge.jpg", image);
        REQUIRE(err.result == MediaResult::DECODE_ERROR);
        REQUIRE(err.technical_msg.find("too large") != std::string::npos);
    }

    REQUIRE(image.empty());
}

TEST_CASE("ImageOps: TIFF sources", "[image][tiff]") {
    TempDir tmp;
    write_test_tiff(tmp.media("scan.tiff"), 120, 80);

    int width = 0, height = 0;
    REQUIRE(image_ops::read_dimensions(tmp.media("scan.tiff"), width, height));
    REQUIRE(width == 120);
    REQUIRE(height == 80);

    RgbaImage image;
    REQUIRE(image_ops::decode_file(tmp.media("scan.tiff"), image));
    REQUIRE(image.width == 120);
    REQUIRE(image.height == 80);

    // Rows come out top-down: red on top, blue below
    const uint8_t* top = image.at(60, 10);
    REQUIRE(top[0] == 220);
    REQUIRE(top[2] == 0);
    const uint8_t* bottom = image.at(60, 70);
    REQUIRE(bottom[0] == 0);
    REQUIRE(bottom[2] == 220);
    REQUIRE(bottom[3] == 255);
}

TEST_CASE("ImageOps: JPEG file writes are atomic", "[image]") {
    TempDir tmp;
    std::string path = tmp.cache("out.jpg");

    REQUIRE(image_ops::write_jpeg_file(solid_image(40, 30, 9, 9, 9), path));
    REQUIRE(fs::exists(path));
    REQUIRE_FALSE(fs::exists(path + ".tmp"));
    REQUIRE(image_size(path) == std::make_pair(40, 30));

    SECTION("empty image is refused") {
        MediaError err = image_ops::write_jpeg_file(RgbaImage(), tmp.cache("empty.jpg"));
        REQUIRE_FALSE(err);
        REQUIRE_FALSE(fs::exists(tmp.cache("empty.jpg")));
    }

    SECTION("missing directory reports an I/O error") {
        MediaError err =
            image_ops::write_jpeg_file(solid_image(4, 4, 0, 0, 0), tmp.cache("no/such/dir.jpg"));
        REQUIRE(err.result == MediaResult::IO_ERROR);
    }
}
