// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "media_error.h"

#include <chrono>
#include <string>

namespace mediashelf {

/**
 * @brief Runs an external video tool to grab a single frame
 *
 * The command is invoked directly via fork/exec (no shell) as
 * `<command> -i <input> -ss 00:00:05 -vframes 1 <output>`. Success requires
 * exit status 0 and the output file existing afterwards. The child gets a
 * bounded wall-clock budget and is killed when it runs over.
 */
class FrameExtractor {
  public:
    static constexpr const char* DEFAULT_COMMAND = "ffmpeg";
    static constexpr const char* SEEK_POSITION = "00:00:05";

    explicit FrameExtractor(std::string command = DEFAULT_COMMAND,
                            std::chrono::milliseconds timeout = std::chrono::seconds(30));

    /// True if the command resolves to an executable (absolute path or PATH lookup)
    [[nodiscard]] bool is_available() const;

    /**
     * @brief Extract the frame at the seek position into @p output_path
     *
     * @return TOOL_UNAVAILABLE if the command cannot be found, EXTERNAL_TOOL_ERROR
     *         with the captured stdout/stderr on failure or timeout
     */
    MediaError extract_frame(const std::string& input_path, const std::string& output_path) const;

    const std::string& command() const {
        return command_;
    }

    /// Resolve @p command against PATH, empty if not found
    static std::string find_in_path(const std::string& command);

  private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

} // namespace mediashelf
