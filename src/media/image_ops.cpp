// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "image_ops.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>

#include "stb_image.h"
#include "stb_image_resize.h"
#include "stb_image_write.h"

#include <tiffio.h>

namespace mediashelf {

// Safety limit to prevent memory exhaustion on hostile headers (~100 MP)
static constexpr long long MAX_SOURCE_PIXELS = 100LL * 1000 * 1000;

RgbaImage RgbaImage::filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    RgbaImage image(w, h);
    for (size_t i = 0; i < image.pixels.size(); i += 4) {
        image.pixels[i] = r;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = b;
        image.pixels[i + 3] = a;
    }
    return image;
}

namespace image_ops {

namespace {

MediaError adopt_stb_pixels(unsigned char* pixels, int w, int h, const std::string& label,
                            RgbaImage& out) {
    if (!pixels) {
        return MediaErrorHelper::decode_error(label, stbi_failure_reason());
    }
    out.width = w;
    out.height = h;
    out.pixels.assign(pixels, pixels + static_cast<size_t>(w) * h * 4);
    stbi_image_free(pixels);
    return MediaErrorHelper::success();
}

MediaError check_pixel_budget(int w, int h, const std::string& label) {
    if (static_cast<long long>(w) * h > MAX_SOURCE_PIXELS) {
        return MediaErrorHelper::decode_error(label, "image too large (" + std::to_string(w) +
                                                         "x" + std::to_string(h) + ")");
    }
    return MediaErrorHelper::success();
}

std::once_flag tiff_handlers_once;

std::string format_tiff_message(const char* module, const char* fmt, va_list ap) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    return module ? std::string(module) + ": " + buffer : std::string(buffer);
}

void tiff_error_handler(const char* module, const char* fmt, va_list ap) {
    spdlog::debug("[ImageOps] libtiff error: {}", format_tiff_message(module, fmt, ap));
}

void tiff_warning_handler(const char* module, const char* fmt, va_list ap) {
    spdlog::trace("[ImageOps] libtiff warning: {}", format_tiff_message(module, fmt, ap));
}

// libtiff prints to stderr unless handlers are installed
void install_tiff_handlers() {
    std::call_once(tiff_handlers_once, [] {
        TIFFSetErrorHandler(tiff_error_handler);
        TIFFSetWarningHandler(tiff_warning_handler);
    });
}

using TiffHandle = std::unique_ptr<TIFF, decltype(&TIFFClose)>;

TiffHandle open_tiff(const std::string& path) {
    install_tiff_handlers();
    return TiffHandle(TIFFOpen(path.c_str(), "r"), &TIFFClose);
}

bool has_tiff_magic(const uint8_t* data, size_t size) {
    if (size < 4) {
        return false;
    }
    return (data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00) ||
           (data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A);
}

bool file_has_tiff_magic(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    uint8_t magic[4] = {};
    if (!file.read(reinterpret_cast<char*>(magic), sizeof(magic))) {
        return false;
    }
    return has_tiff_magic(magic, sizeof(magic));
}

MediaError tiff_dimensions(TIFF* tif, const std::string& path, uint32_t& width,
                           uint32_t& height) {
    if (!TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width) ||
        !TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height) || width == 0 || height == 0 ||
        width > INT_MAX || height > INT_MAX) {
        return MediaErrorHelper::decode_error(path, "TIFF without valid dimensions");
    }
    return MediaErrorHelper::success();
}

/// Decode the first directory of a TIFF, honouring its orientation tag
MediaError decode_tiff(const std::string& path, RgbaImage& out) {
    TiffHandle tif = open_tiff(path);
    if (!tif) {
        return MediaErrorHelper::decode_error(path, "unreadable TIFF");
    }

    uint32_t width = 0, height = 0;
    MediaError err = tiff_dimensions(tif.get(), path, width, height);
    if (!err) {
        return err;
    }
    err = check_pixel_budget(static_cast<int>(width), static_cast<int>(height), path);
    if (!err) {
        return err;
    }

    std::vector<uint32_t> raster(static_cast<size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(), ORIENTATION_TOPLEFT,
                                   0)) {
        return MediaErrorHelper::decode_error(path, "unsupported TIFF layout");
    }

    RgbaImage image(static_cast<int>(width), static_cast<int>(height));
    for (size_t i = 0; i < raster.size(); ++i) {
        const uint32_t px = raster[i];
        image.pixels[i * 4] = static_cast<uint8_t>(TIFFGetR(px));
        image.pixels[i * 4 + 1] = static_cast<uint8_t>(TIFFGetG(px));
        image.pixels[i * 4 + 2] = static_cast<uint8_t>(TIFFGetB(px));
        image.pixels[i * 4 + 3] = static_cast<uint8_t>(TIFFGetA(px));
    }
    out = std::move(image);
    return MediaErrorHelper::success();
}

void append_bytes(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

MediaError decode_file(const std::string& path, RgbaImage& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return MediaErrorHelper::not_found(path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (has_tiff_magic(data.data(), data.size())) {
        return decode_tiff(path, out);
    }
    return decode_memory(data.data(), data.size(), path, out);
}

MediaError decode_memory(const uint8_t* data, size_t size, const std::string& label,
                         RgbaImage& out) {
    if (size == 0) {
        return MediaErrorHelper::decode_error(label, "empty file");
    }
    if (size > static_cast<size_t>(INT_MAX)) {
        return MediaErrorHelper::decode_error(label, "file too large (" + std::to_string(size) +
                                                         " bytes)");
    }

    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_memory(data, static_cast<int>(size), &w, &h, &channels)) {
        return MediaErrorHelper::decode_error(label, stbi_failure_reason());
    }
    MediaError err = check_pixel_budget(w, h, label);
    if (!err) {
        return err;
    }

    // Request RGBA output regardless of source format
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels, 4);
    return adopt_stb_pixels(pixels, w, h, label, out);
}

MediaError read_dimensions(const std::string& path, int& width, int& height) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return MediaErrorHelper::not_found(path);
    }
    if (file_has_tiff_magic(path)) {
        TiffHandle tif = open_tiff(path);
        if (!tif) {
            return MediaErrorHelper::decode_error(path, "unreadable TIFF");
        }
        uint32_t w = 0, h = 0;
        MediaError err = tiff_dimensions(tif.get(), path, w, h);
        if (!err) {
            return err;
        }
        width = static_cast<int>(w);
        height = static_cast<int>(h);
        return MediaErrorHelper::success();
    }

    int channels = 0;
    if (!stbi_info(path.c_str(), &width, &height, &channels)) {
        return MediaErrorHelper::decode_error(path, stbi_failure_reason());
    }
    return MediaErrorHelper::success();
}

RgbaImage resize_box(const RgbaImage& src, int width, int height) {
    width = std::max(width, 1);
    height = std::max(height, 1);
    if (width == src.width && height == src.height) {
        return src;
    }

    RgbaImage out(width, height);
    int ok = stbir_resize_uint8_generic(src.pixels.data(), src.width, src.height, 0,
                                        out.pixels.data(), width, height, 0, 4, 3, 0,
                                        STBIR_EDGE_CLAMP, STBIR_FILTER_BOX,
                                        STBIR_COLORSPACE_LINEAR, nullptr);
    if (!ok) {
        spdlog::error("[ImageOps] Resize {}x{} -> {}x{} failed", src.width, src.height, width,
                      height);
        return RgbaImage();
    }
    return out;
}

RgbaImage fit_box(const RgbaImage& src, int max_width, int max_height) {
    if (src.width <= max_width && src.height <= max_height) {
        return src;
    }

    double src_aspect = static_cast<double>(src.width) / src.height;
    double box_aspect = static_cast<double>(max_width) / max_height;

    int out_width, out_height;
    if (src_aspect > box_aspect) {
        out_width = max_width;
        out_height = static_cast<int>(std::lround(src.height * (double(max_width) / src.width)));
    } else {
        out_height = max_height;
        out_width = static_cast<int>(std::lround(src.width * (double(max_height) / src.height)));
    }
    return resize_box(src, std::max(out_width, 1), std::max(out_height, 1));
}

RgbaImage flip_horizontal(const RgbaImage& src) {
    RgbaImage out(src.width, src.height);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            std::copy_n(src.at(x, y), 4, out.at(src.width - 1 - x, y));
        }
    }
    return out;
}

RgbaImage flip_vertical(const RgbaImage& src) {
    RgbaImage out(src.width, src.height);
    const size_t row = static_cast<size_t>(src.width) * 4;
    for (int y = 0; y < src.height; ++y) {
        std::copy_n(src.at(0, y), row, out.at(0, src.height - 1 - y));
    }
    return out;
}

RgbaImage rotate_180(const RgbaImage& src) {
    RgbaImage out(src.width, src.height);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            std::copy_n(src.at(x, y), 4, out.at(src.width - 1 - x, src.height - 1 - y));
        }
    }
    return out;
}

RgbaImage rotate_90_cw(const RgbaImage& src) {
    RgbaImage out(src.height, src.width);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            std::copy_n(src.at(x, y), 4, out.at(src.height - 1 - y, x));
        }
    }
    return out;
}

RgbaImage rotate_90_ccw(const RgbaImage& src) {
    RgbaImage out(src.height, src.width);
    for (int y = 0; y < src.height; ++y) {
        for (int x = 0; x < src.width; ++x) {
            std::copy_n(src.at(x, y), 4, out.at(y, src.width - 1 - x));
        }
    }
    return out;
}

void paste(RgbaImage& dst, const RgbaImage& src, int x, int y) {
    for (int sy = 0; sy < src.height; ++sy) {
        int dy = y + sy;
        if (dy < 0 || dy >= dst.height) {
            continue;
        }
        for (int sx = 0; sx < src.width; ++sx) {
            int dx = x + sx;
            if (dx < 0 || dx >= dst.width) {
                continue;
            }
            std::copy_n(src.at(sx, sy), 4, dst.at(dx, dy));
        }
    }
}

void overlay(RgbaImage& dst, const RgbaImage& src, int x, int y) {
    for (int sy = 0; sy < src.height; ++sy) {
        int dy = y + sy;
        if (dy < 0 || dy >= dst.height) {
            continue;
        }
        for (int sx = 0; sx < src.width; ++sx) {
            int dx = x + sx;
            if (dx < 0 || dx >= dst.width) {
                continue;
            }
            const uint8_t* s = src.at(sx, sy);
            uint8_t* d = dst.at(dx, dy);
            unsigned alpha = s[3];
            for (int c = 0; c < 3; ++c) {
                d[c] = static_cast<uint8_t>((s[c] * alpha + d[c] * (255 - alpha) + 127) / 255);
            }
            d[3] = static_cast<uint8_t>(alpha + (d[3] * (255 - alpha) + 127) / 255);
        }
    }
}

MediaError encode_jpeg(const RgbaImage& image, std::vector<uint8_t>& out, int quality) {
    if (image.empty()) {
        return MediaErrorHelper::io_error("Cannot encode empty image");
    }

    std::vector<uint8_t> rgb(static_cast<size_t>(image.width) * image.height * 3);
    for (size_t i = 0, j = 0; i < image.pixels.size(); i += 4, j += 3) {
        unsigned alpha = image.pixels[i + 3];
        for (int c = 0; c < 3; ++c) {
            rgb[j + c] = static_cast<uint8_t>((image.pixels[i + c] * alpha + 127) / 255);
        }
    }

    out.clear();
    if (!stbi_write_jpg_to_func(append_bytes, &out, image.width, image.height, 3, rgb.data(),
                                quality)) {
        return MediaErrorHelper::io_error("JPEG encoding failed");
    }
    return MediaErrorHelper::success();
}

MediaError write_jpeg_file(const RgbaImage& image, const std::string& path, int quality) {
    std::vector<uint8_t> encoded;
    MediaError err = encode_jpeg(image, encoded, quality);
    if (!err) {
        return err;
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return MediaErrorHelper::io_error("Cannot open " + tmp_path + " for writing");
        }
        file.write(reinterpret_cast<const char*>(encoded.data()),
                   static_cast<std::streamsize>(encoded.size()));
        if (!file) {
            return MediaErrorHelper::io_error("Short write to " + tmp_path);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return MediaErrorHelper::io_error("Cannot move artifact into place at " + path);
    }
    return MediaErrorHelper::success();
}

} // namespace image_ops
} // namespace mediashelf
