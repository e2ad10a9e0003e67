// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "frame_extractor.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace mediashelf {

namespace {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t MAX_CAPTURED_OUTPUT = 16 * 1024;

/// Read whatever the child has written so far, keeping only the tail
void drain_pipe(int fd, std::string& captured) {
    char buffer[4096];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        captured.append(buffer, static_cast<size_t>(n));
    }
    if (captured.size() > MAX_CAPTURED_OUTPUT) {
        captured.erase(0, captured.size() - MAX_CAPTURED_OUTPUT);
    }
}

bool is_executable(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

FrameExtractor::FrameExtractor(std::string command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

std::string FrameExtractor::find_in_path(const std::string& command) {
    if (command.empty()) {
        return "";
    }
    if (command.find('/') != std::string::npos) {
        return is_executable(command) ? command : "";
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return "";
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        std::string candidate = (dir.empty() ? "." : dir) + "/" + command;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return "";
}

bool FrameExtractor::is_available() const {
    return !find_in_path(command_).empty();
}

MediaError FrameExtractor::extract_frame(const std::string& input_path,
                                         const std::string& output_path) const {
    std::string executable = find_in_path(command_);
    if (executable.empty()) {
        return MediaErrorHelper::tool_unavailable(command_);
    }

    std::string command_line =
        command_ + " -i " + input_path + " -ss " + SEEK_POSITION + " -vframes 1 " + output_path;

    // A leftover output would make the tool stop and ask before overwriting
    std::error_code ec;
    std::filesystem::remove(output_path, ec);

    int fds[2];
    if (pipe(fds) != 0) {
        return MediaErrorHelper::io_error(std::string("pipe failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return MediaErrorHelper::io_error(std::string("fork failed: ") + strerror(errno));
    }

    if (pid == 0) {
        // Child process - exec the tool directly (no shell)
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execl(executable.c_str(), command_.c_str(), "-i", input_path.c_str(), "-ss",
              SEEK_POSITION, "-vframes", "1", output_path.c_str(), static_cast<char*>(nullptr));
        // exec failed
        _exit(127);
    }

    // Parent process - wait for child with timeout, draining its output
    close(fds[1]);
    fcntl(fds[0], F_SETFL, fcntl(fds[0], F_GETFL) | O_NONBLOCK);

    auto start_time = std::chrono::steady_clock::now();
    std::string captured;
    int status = 0;
    bool timed_out = false;
    bool child_done = false;

    while (!child_done) {
        drain_pipe(fds[0], captured);

        pid_t wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result == pid) {
            child_done = true;
        } else if (wait_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = strerror(errno);
            close(fds[0]);
            return MediaErrorHelper::io_error("waitpid failed: " + reason);
        } else if (std::chrono::steady_clock::now() - start_time > timeout_) {
            timed_out = true;
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            child_done = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }
    }

    drain_pipe(fds[0], captured);
    close(fds[0]);

    if (timed_out) {
        std::filesystem::remove(output_path, ec);
        spdlog::warn("[FrameExtractor] '{}' timed out after {} ms", command_line, timeout_.count());
        return MediaErrorHelper::external_tool_error("Command '" + command_line +
                                                     "' timed out after " +
                                                     std::to_string(timeout_.count()) + " ms");
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code != 0) {
        return MediaErrorHelper::external_tool_error("Command '" + command_line +
                                                     "' failed with exit code " +
                                                     std::to_string(exit_code) + ":\n" + captured);
    }

    if (!std::filesystem::exists(output_path, ec)) {
        return MediaErrorHelper::external_tool_error("Command '" + command_line +
                                                     "' produced no output:\n" + captured);
    }

    spdlog::trace("[FrameExtractor] Extracted frame from {}", input_path);
    return MediaErrorHelper::success();
}

} // namespace mediashelf
