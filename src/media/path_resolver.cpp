// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace mediashelf {

namespace {

bool escapes_upward(const std::string& offset) {
    return offset.empty() || offset == ".." || offset.rfind("../", 0) == 0;
}

} // namespace

std::string PathResolver::normalize(const std::string& path) {
    std::string result = fs::path(path).lexically_normal().generic_string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result.empty() ? "." : result;
}

MediaError PathResolver::resolve(const std::string& root, const std::string& relative,
                                 std::string& full_path) {
    const std::string base = normalize(root);
    const std::string joined = normalize((fs::path(base) / fs::path(relative)).string());

    std::string offset = fs::path(joined).lexically_relative(fs::path(base)).generic_string();
    if (escapes_upward(offset)) {
        spdlog::warn("[PathResolver] Rejected path outside root {}: '{}'", base, relative);
        return MediaErrorHelper::path_escape(relative);
    }

    full_path = joined;
    return MediaErrorHelper::success();
}

MediaError PathResolver::relativize(const std::string& root, const std::string& full_path,
                                    std::string& relative) {
    const std::string base = normalize(root);
    const std::string target = normalize(full_path);

    std::string offset = fs::path(target).lexically_relative(fs::path(base)).generic_string();
    if (escapes_upward(offset)) {
        return MediaErrorHelper::not_a_subpath(base, target);
    }

    relative = (offset == ".") ? "" : normalize(offset);
    return MediaErrorHelper::success();
}

std::string PathResolver::join(const std::string& base, const std::string& name) {
    if (base.empty() || base == ".") {
        return name;
    }
    if (name.empty()) {
        return base;
    }
    return base + "/" + name;
}

std::string PathResolver::parent(const std::string& relative) {
    auto pos = relative.rfind('/');
    return pos == std::string::npos ? "" : relative.substr(0, pos);
}

std::string PathResolver::base_name(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto pos = trimmed.rfind('/');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

} // namespace mediashelf
