// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace mediashelf {

Config* Config::instance{nullptr};

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"media", {{"path", ""}, {"auto_rotate", true}, {"ignore_exif_thumbs", false}}},
            {"cache",
             {{"path", (fs::temp_directory_path() / "mediashelf").generic_string()},
              {"enable_thumbnails", true},
              {"gen_thumbs_on_startup", false},
              {"gen_thumbs_on_add", true},
              {"enable_cleanup", false}}},
            {"preview",
             {{"enable", false},
              {"max_side", 1280},
              {"gen_on_startup", false},
              {"gen_on_add", true},
              {"gen_for_small_images", false}}},
            {"video", {{"extractor_command", "ffmpeg"}, {"extract_timeout_sec", 30}}},
            {"watcher", {{"enable", true}}},
            {"log_level", "info"},
            {"log_path", ""}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        // Load existing config
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }
    } else {
        // Create default config
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    // Save updated config with any new defaults
    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with unsaved defaults");
    }

    spdlog::debug("[Config] initialized: media={}",
                  get<std::string>("/media/path", std::string()));
}

std::string Config::get_path() const {
    return path;
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();

        fs::rename(tmp_path, path);
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return false;
    }
}

} // namespace mediashelf
