// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "exif_reader.h"

#include <spdlog/spdlog.h>

#include <exiv2/exiv2.hpp>

#include <mutex>

namespace mediashelf {

namespace {

std::once_flag exiv2_init_once;

void exiv2_log_handler(int level, const char* message) {
    std::string text(message ? message : "");
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (level >= Exiv2::LogMsg::warn) {
        spdlog::debug("[ExifReader] exiv2: {}", text);
    } else {
        spdlog::trace("[ExifReader] exiv2: {}", text);
    }
}

// Exiv2 logs malformed metadata to stderr by default, and its XMP toolkit
// must be initialized once before concurrent readers
void init_exiv2() {
    std::call_once(exiv2_init_once, [] {
        Exiv2::XmpParser::initialize();
        Exiv2::LogMsg::setHandler(exiv2_log_handler);
    });
}

std::optional<ExifData> extract(Exiv2::Image& image) {
    if (image.mimeType() != "image/jpeg") {
        return std::nullopt;
    }

    image.readMetadata();
    const Exiv2::ExifData& exif = image.exifData();
    if (exif.empty()) {
        return std::nullopt;
    }

    ExifData out;
    auto pos = exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
    if (pos != exif.end() && pos->count() > 0) {
        int64_t value = pos->toInt64();
        if (value >= 1 && value <= 8) {
            out.orientation = static_cast<int>(value);
        }
    }

    Exiv2::ExifThumbC thumb(exif);
    Exiv2::DataBuf buf = thumb.copy();
    if (!buf.empty()) {
        out.thumbnail.assign(buf.c_data(), buf.c_data() + buf.size());
    }
    return out;
}

} // namespace

std::optional<ExifData> ExifReader::parse(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return std::nullopt;
    }
    init_exiv2();

    try {
        auto image = Exiv2::ImageFactory::open(data, size);
        return extract(*image);
    } catch (const Exiv2::Error& e) {
        spdlog::debug("[ExifReader] No EXIF in {} byte buffer: {}", size, e.what());
        return std::nullopt;
    }
}

std::optional<ExifData> ExifReader::read_file(const std::string& path) {
    init_exiv2();

    try {
        auto image = Exiv2::ImageFactory::open(path);
        return extract(*image);
    } catch (const Exiv2::Error& e) {
        spdlog::debug("[ExifReader] No EXIF in {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace mediashelf
