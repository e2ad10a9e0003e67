// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "artifact_cache.h"
#include "media_error.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

struct inotify_event;

/**
 * @file directory_watcher.h
 * @brief Recursive inotify watcher keeping the cache in step with the media tree
 *
 * inotify watches are not recursive, so the watcher keeps an explicit watch
 * tree (directory path <-> watch descriptor) and registers a node for every
 * directory that appears, removing the node and its descendants when the
 * directory goes away.
 *
 * New or rewritten files are not processed on the first event. They sit in a
 * pending queue until size and mtime stop changing for the settle time and no
 * other process holds a lock on them. Failures on files that were just
 * written are retried with FailurePolicy::RETRY; only the last attempt may
 * memoize an error marker.
 */

namespace mediashelf {

/**
 * @brief Receiver of settled watcher events (called on the watcher thread)
 */
class WatchListener {
  public:
    virtual ~WatchListener() = default;

    /**
     * @brief A supported media file appeared or was rewritten
     * @param relative File relative to the media root
     * @param policy Whether a payload failure may be memoized
     * @param replaced Content changed, existing artifacts are stale
     */
    virtual MediaError on_file_added(const std::string& relative, FailurePolicy policy,
                                     bool replaced) = 0;

    virtual void on_file_removed(const std::string& relative) = 0;

    virtual void on_directory_removed(const std::string& relative) = 0;
};

struct WatcherSettings {
    std::chrono::milliseconds settle_time{300};
    std::chrono::milliseconds retry_delay{1000};
    int max_attempts = 5;
    int poll_interval_ms = 100;
};

class DirectoryWatcher {
  public:
    DirectoryWatcher(std::string media_root, WatchListener& listener,
                     WatcherSettings settings = {});
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    /**
     * @brief Watch the media root and all its sub-directories, start the monitor thread
     */
    MediaError start();

    /// Stop the monitor thread and drop every watch
    void stop();

    [[nodiscard]] bool is_running() const;

    /**
     * @brief Add a directory and its sub-directories to the watch tree
     * @return NOT_FOUND if @p relative is missing or not a directory
     */
    MediaError watch_folder(const std::string& relative);

    [[nodiscard]] bool is_watched(const std::string& relative) const;
    [[nodiscard]] size_t watch_count() const;
    [[nodiscard]] size_t pending_count() const;

  private:
    struct PendingFile {
        std::chrono::steady_clock::time_point due;
        std::uintmax_t size = 0;
        std::filesystem::file_time_type mtime{};
        bool stat_known = false;
        bool replaced = false;
        int attempts = 0;
    };

    struct ReadyFile {
        std::string relative;
        int attempts;
        bool replaced;
    };

    void monitor_thread_func();
    void handle_event(const struct inotify_event* event);
    void process_pending();

    MediaError add_watch_tree(const std::string& relative, bool enqueue_files);
    void remove_watch_tree(const std::string& relative);
    void enqueue(const std::string& relative, bool replaced);

    const std::string media_root_;
    WatchListener& listener_;
    const WatcherSettings settings_;

    int inotify_fd_ = -1;
    bool running_ = false;
    std::atomic<bool> stop_requested_{false};
    std::thread monitor_thread_;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::string> wd_to_dir_;
    std::map<std::string, int> dir_to_wd_;
    std::map<std::string, PendingFile> pending_;
};

} // namespace mediashelf
