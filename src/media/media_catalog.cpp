// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "media_catalog.h"

#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace mediashelf {

namespace {

constexpr std::array<const char*, 6> IMAGE_EXTENSIONS = {".png", ".jpg",  ".jpeg",
                                                         ".tif", ".tiff", ".gif"};
constexpr std::array<const char*, 5> VIDEO_EXTENSIONS = {".avi", ".mov", ".vid", ".mkv", ".mp4"};

template <size_t N>
bool contains(const std::array<const char*, N>& set, const std::string& ext) {
    return std::any_of(set.begin(), set.end(), [&ext](const char* e) { return ext == e; });
}

} // namespace

const char* media_type_to_string(MediaType type) {
    switch (type) {
    case MediaType::FOLDER:
        return "folder";
    case MediaType::IMAGE:
        return "image";
    case MediaType::VIDEO:
        return "video";
    default:
        return "unsupported";
    }
}

std::string MediaCatalog::extension(const std::string& name) {
    std::string base = PathResolver::base_name(name);
    auto dot = base.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string ext = base.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

MediaType MediaCatalog::classify(const std::string& name) {
    std::string ext = extension(name);
    if (contains(IMAGE_EXTENSIONS, ext)) {
        return MediaType::IMAGE;
    }
    if (contains(VIDEO_EXTENSIONS, ext)) {
        return MediaType::VIDEO;
    }
    return MediaType::UNSUPPORTED;
}

bool MediaCatalog::is_jpeg(const std::string& name) {
    std::string ext = extension(name);
    return ext == ".jpg" || ext == ".jpeg";
}

MediaError MediaCatalog::list(const std::string& root, const std::string& relative,
                              std::vector<MediaEntry>& entries) {
    std::string dir_path;
    MediaError err = PathResolver::resolve(root, relative, dir_path);
    if (!err) {
        return err;
    }

    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        return MediaErrorHelper::not_found(relative.empty() ? dir_path : relative);
    }

    std::string rel_dir;
    err = PathResolver::relativize(root, dir_path, rel_dir);
    if (!err) {
        return err;
    }

    std::vector<MediaEntry> result;
    try {
        for (const auto& dir_entry : fs::directory_iterator(dir_path)) {
            std::string name = dir_entry.path().filename().string();

            MediaType type;
            if (dir_entry.is_symlink() || dir_entry.is_directory()) {
                type = MediaType::FOLDER;
            } else {
                type = classify(name);
            }

            if (type == MediaType::UNSUPPORTED) {
                spdlog::debug("[MediaCatalog] Skipping {} in '{}'", name, rel_dir);
                continue;
            }

            spdlog::trace("[MediaCatalog] {} {}", media_type_to_string(type), name);
            result.push_back({type, name, PathResolver::join(rel_dir, name)});
        }
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("[MediaCatalog] Failed to list {}: {}", dir_path, e.what());
        return MediaErrorHelper::io_error(e.what());
    }

    std::sort(result.begin(), result.end(),
              [](const MediaEntry& a, const MediaEntry& b) { return a.name < b.name; });

    entries = std::move(result);
    return MediaErrorHelper::success();
}

} // namespace mediashelf
