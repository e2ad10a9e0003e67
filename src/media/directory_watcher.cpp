// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "directory_watcher.h"

#include "media_catalog.h"
#include "path_resolver.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace mediashelf {

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO |
                                IN_MOVED_FROM | IN_DELETE | IN_DELETE_SELF | IN_ONLYDIR;

bool is_under(const std::string& path, const std::string& dir) {
    if (dir.empty()) {
        return true;
    }
    return path == dir || path.compare(0, dir.size() + 1, dir + "/") == 0;
}

bool is_retryable(MediaResult result) {
    switch (result) {
    case MediaResult::DECODE_ERROR:
    case MediaResult::EXTERNAL_TOOL_ERROR:
    case MediaResult::FILE_LOCKED:
    case MediaResult::IO_ERROR:
        return true;
    default:
        return false;
    }
}

} // namespace

DirectoryWatcher::DirectoryWatcher(std::string media_root, WatchListener& listener,
                                   WatcherSettings settings)
    : media_root_(PathResolver::normalize(media_root)), listener_(listener),
      settings_(settings) {}

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

MediaError DirectoryWatcher::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return MediaErrorHelper::success();
        }

        inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd_ < 0) {
            spdlog::error("[DirectoryWatcher] Failed to init inotify: {}", strerror(errno));
            return MediaErrorHelper::io_error("inotify_init failed: " +
                                              std::string(strerror(errno)));
        }
    }

    MediaError err = add_watch_tree("", false);
    if (!err) {
        std::lock_guard<std::mutex> lock(mutex_);
        close(inotify_fd_);
        inotify_fd_ = -1;
        wd_to_dir_.clear();
        dir_to_wd_.clear();
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        running_ = true;
        spdlog::info("[DirectoryWatcher] Watching {} ({} directories)", media_root_,
                     dir_to_wd_.size());
    }
    monitor_thread_ = std::thread(&DirectoryWatcher::monitor_thread_func, this);
    return MediaErrorHelper::success();
}

void DirectoryWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }

    // Wait for monitor thread
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [wd, dir] : wd_to_dir_) {
        inotify_rm_watch(inotify_fd_, wd);
    }
    wd_to_dir_.clear();
    dir_to_wd_.clear();
    pending_.clear();
    if (inotify_fd_ >= 0) {
        close(inotify_fd_);
        inotify_fd_ = -1;
    }
    running_ = false;
    spdlog::debug("[DirectoryWatcher] Stopped");
}

bool DirectoryWatcher::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool DirectoryWatcher::is_watched(const std::string& relative) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dir_to_wd_.count(relative) > 0;
}

size_t DirectoryWatcher::watch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dir_to_wd_.size();
}

size_t DirectoryWatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

MediaError DirectoryWatcher::watch_folder(const std::string& relative) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inotify_fd_ < 0) {
            return MediaErrorHelper::io_error("Watcher not started");
        }
    }
    return add_watch_tree(relative, false);
}

// ============================================================================
// Watch tree
// ============================================================================

MediaError DirectoryWatcher::add_watch_tree(const std::string& relative, bool enqueue_files) {
    std::string full_path;
    MediaError err = PathResolver::resolve(media_root_, relative, full_path);
    if (!err) {
        return err;
    }

    std::error_code ec;
    if (!fs::is_directory(full_path, ec)) {
        return MediaErrorHelper::not_found(relative.empty() ? full_path : relative);
    }

    std::string key;
    err = PathResolver::relativize(media_root_, full_path, key);
    if (!err) {
        return err;
    }

    int wd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wd = inotify_add_watch(inotify_fd_, full_path.c_str(), WATCH_MASK);
        if (wd < 0) {
            spdlog::warn("[DirectoryWatcher] Failed to watch {}: {}", full_path, strerror(errno));
            return MediaErrorHelper::io_error("inotify_add_watch failed for " + full_path);
        }
        wd_to_dir_[wd] = key;
        dir_to_wd_[key] = wd;
    }
    spdlog::debug("[DirectoryWatcher] Watching '{}' (wd={})", key, wd);

    try {
        for (const auto& entry : fs::directory_iterator(full_path)) {
            std::string child = PathResolver::join(key, entry.path().filename().string());
            if (entry.is_directory() && !entry.is_symlink()) {
                MediaError child_err = add_watch_tree(child, enqueue_files);
                if (!child_err) {
                    spdlog::warn("[DirectoryWatcher] Sub-directory '{}' not watched: {}", child,
                                 child_err.technical_msg);
                }
            } else if (enqueue_files && entry.is_regular_file() &&
                       MediaCatalog::classify(child) != MediaType::UNSUPPORTED) {
                enqueue(child, false);
            }
        }
    } catch (const fs::filesystem_error& e) {
        // Directory may vanish while being scanned
        spdlog::debug("[DirectoryWatcher] Scan of '{}' interrupted: {}", key, e.what());
    }
    return MediaErrorHelper::success();
}

void DirectoryWatcher::remove_watch_tree(const std::string& relative) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = dir_to_wd_.lower_bound(relative); it != dir_to_wd_.end();) {
        if (!is_under(it->first, relative)) {
            if (it->first.compare(0, relative.size(), relative) != 0) {
                break;
            }
            ++it;
            continue;
        }
        // The kernel drops watches of deleted directories on its own
        if (inotify_rm_watch(inotify_fd_, it->second) != 0 && errno != EINVAL) {
            spdlog::debug("[DirectoryWatcher] inotify_rm_watch({}) failed: {}", it->first,
                          strerror(errno));
        }
        wd_to_dir_.erase(it->second);
        it = dir_to_wd_.erase(it);
    }

    for (auto it = pending_.begin(); it != pending_.end();) {
        it = is_under(it->first, relative) ? pending_.erase(it) : std::next(it);
    }
    spdlog::debug("[DirectoryWatcher] Unwatched '{}'", relative);
}

void DirectoryWatcher::enqueue(const std::string& relative, bool replaced) {
    std::lock_guard<std::mutex> lock(mutex_);
    PendingFile& pending = pending_[relative];
    pending.due = std::chrono::steady_clock::now() + settings_.settle_time;
    pending.replaced = pending.replaced || replaced;
}

// ============================================================================
// Monitor thread
// ============================================================================

void DirectoryWatcher::monitor_thread_func() {
    spdlog::debug("[DirectoryWatcher] Monitor thread started");

    constexpr size_t EVENT_BUF_SIZE = 4096;
    alignas(struct inotify_event) char event_buf[EVENT_BUF_SIZE];

    while (!stop_requested_) {
        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, settings_.poll_interval_ms);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[DirectoryWatcher] poll() failed: {}", strerror(errno));
            break;
        }

        if (ret > 0 && (pfd.revents & POLLIN)) {
            ssize_t len;
            while ((len = read(inotify_fd_, event_buf, EVENT_BUF_SIZE)) > 0) {
                for (char* ptr = event_buf; ptr < event_buf + len;) {
                    auto* event = reinterpret_cast<struct inotify_event*>(ptr);
                    handle_event(event);
                    ptr += sizeof(struct inotify_event) + event->len;
                }
            }
            if (len < 0 && errno != EAGAIN && errno != EINTR) {
                spdlog::error("[DirectoryWatcher] read() failed: {}", strerror(errno));
                break;
            }
        }

        process_pending();
    }

    spdlog::debug("[DirectoryWatcher] Monitor thread exiting");
}

void DirectoryWatcher::handle_event(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        spdlog::warn("[DirectoryWatcher] Event queue overflow, rescanning media tree");
        MediaError err = add_watch_tree("", true);
        if (!err) {
            spdlog::error("[DirectoryWatcher] Rescan failed: {}", err.technical_msg);
        }
        return;
    }

    std::string dir;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = wd_to_dir_.find(event->wd);
        if (it == wd_to_dir_.end()) {
            return;
        }
        dir = it->second;
        if (event->mask & IN_IGNORED) {
            dir_to_wd_.erase(dir);
            wd_to_dir_.erase(it);
            return;
        }
    }

    if (event->mask & IN_DELETE_SELF) {
        if (dir.empty()) {
            spdlog::warn("[DirectoryWatcher] Media root {} was removed", media_root_);
        }
        return;
    }

    if (event->len == 0) {
        return;
    }
    std::string relative = PathResolver::join(dir, event->name);

    if (event->mask & IN_ISDIR) {
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
            spdlog::debug("[DirectoryWatcher] Directory added: '{}'", relative);
            MediaError err = add_watch_tree(relative, true);
            if (!err) {
                spdlog::warn("[DirectoryWatcher] Unable to watch '{}': {}", relative,
                             err.technical_msg);
            }
        } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
            spdlog::debug("[DirectoryWatcher] Directory removed: '{}'", relative);
            remove_watch_tree(relative);
            listener_.on_directory_removed(relative);
        }
        return;
    }

    if (MediaCatalog::classify(relative) == MediaType::UNSUPPORTED) {
        spdlog::trace("[DirectoryWatcher] Ignoring '{}'", relative);
        return;
    }

    if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
        spdlog::debug("[DirectoryWatcher] File removed: '{}'", relative);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(relative);
        }
        listener_.on_file_removed(relative);
    } else if (event->mask & (IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO)) {
        enqueue(relative, true);
    }
}

void DirectoryWatcher::process_pending() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<ReadyFile> ready;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            PendingFile& pending = it->second;
            if (pending.due > now) {
                ++it;
                continue;
            }

            std::string full_path;
            std::error_code size_ec, time_ec;
            if (!PathResolver::resolve(media_root_, it->first, full_path)) {
                it = pending_.erase(it);
                continue;
            }
            auto size = fs::file_size(full_path, size_ec);
            auto mtime = fs::last_write_time(full_path, time_ec);
            if (size_ec || time_ec) {
                // Gone before it settled
                it = pending_.erase(it);
                continue;
            }

            if (!pending.stat_known || size != pending.size || mtime != pending.mtime) {
                pending.stat_known = true;
                pending.size = size;
                pending.mtime = mtime;
                pending.due = now + settings_.settle_time;
                ++it;
                continue;
            }

            if (ArtifactCache::is_source_locked(full_path)) {
                spdlog::debug("[DirectoryWatcher] '{}' is locked, waiting", it->first);
                pending.due = now + settings_.retry_delay;
                ++it;
                continue;
            }

            ready.push_back({it->first, pending.attempts, pending.replaced});
            ++it;
        }
    }

    for (const auto& file : ready) {
        const int attempt = file.attempts + 1;
        const FailurePolicy policy =
            attempt >= settings_.max_attempts ? FailurePolicy::MEMOIZE : FailurePolicy::RETRY;

        MediaError err = listener_.on_file_added(file.relative, policy, file.replaced);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(file.relative);
        if (it == pending_.end()) {
            continue;
        }

        // A new event re-armed the entry while the listener ran
        PendingFile& pending = it->second;
        if (pending.due > std::chrono::steady_clock::now()) {
            continue;
        }

        if (err || policy == FailurePolicy::MEMOIZE || !is_retryable(err.result)) {
            if (!err) {
                spdlog::warn("[DirectoryWatcher] Giving up on '{}' after {} attempt(s): {}",
                             file.relative, attempt, err.technical_msg);
            }
            pending_.erase(it);
            continue;
        }

        pending.attempts = attempt;
        pending.replaced = false;
        pending.due = std::chrono::steady_clock::now() + settings_.retry_delay * attempt;
        spdlog::debug("[DirectoryWatcher] Retrying '{}' ({}), attempt {}", file.relative,
                      err.technical_msg, attempt + 1);
    }
}

} // namespace mediashelf
