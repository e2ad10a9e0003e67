// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

/**
 * @file media_error.h
 * @brief Error types and helpers for media cache operations
 *
 * Every cache, catalog and watcher operation reports its outcome as a
 * MediaError. The result code decides whether a failure is memoized with an
 * error marker, retried later, or simply reported to the caller.
 */

namespace mediashelf {

/**
 * @brief Media operation result codes
 */
enum class MediaResult {
    SUCCESS = 0, ///< Operation succeeded

    // Path errors
    PATH_ESCAPE,   ///< Relative path resolves outside its root
    NOT_A_SUBPATH, ///< Absolute path is not beneath the expected root
    NOT_FOUND,     ///< Source file or directory does not exist

    // Classification errors
    NO_EXTENSION,     ///< Media name has no extension to replace
    UNSUPPORTED_TYPE, ///< Operation not supported for this media type

    // Generation errors
    DECODE_ERROR,          ///< Corrupt or undecodable media payload
    EXTERNAL_TOOL_ERROR,   ///< Frame extractor failed, timed out or wrote nothing
    TOOL_UNAVAILABLE,      ///< Frame extractor binary not found
    TOO_SMALL_FOR_PREVIEW, ///< Policy skip, image already fits the preview box
    PERMANENTLY_FAILED,    ///< Error marker present for this artifact
    FILE_LOCKED,           ///< Source is still being written by another process

    // Environment errors
    IO_ERROR,     ///< Cache write or filesystem failure
    DISABLED,     ///< Feature switched off in settings
    CONFIG_ERROR, ///< Invalid or incomplete settings
};

/**
 * @brief Get string representation of a media result
 * @param result The result code
 * @return Human-readable string for the result
 */
inline const char* media_result_to_string(MediaResult result) {
    switch (result) {
    case MediaResult::SUCCESS:
        return "Success";
    case MediaResult::PATH_ESCAPE:
        return "Path Escape";
    case MediaResult::NOT_A_SUBPATH:
        return "Not A Subpath";
    case MediaResult::NOT_FOUND:
        return "Not Found";
    case MediaResult::NO_EXTENSION:
        return "No Extension";
    case MediaResult::UNSUPPORTED_TYPE:
        return "Unsupported Type";
    case MediaResult::DECODE_ERROR:
        return "Decode Error";
    case MediaResult::EXTERNAL_TOOL_ERROR:
        return "External Tool Error";
    case MediaResult::TOOL_UNAVAILABLE:
        return "Tool Unavailable";
    case MediaResult::TOO_SMALL_FOR_PREVIEW:
        return "Too Small For Preview";
    case MediaResult::PERMANENTLY_FAILED:
        return "Permanently Failed";
    case MediaResult::FILE_LOCKED:
        return "File Locked";
    case MediaResult::IO_ERROR:
        return "I/O Error";
    case MediaResult::DISABLED:
        return "Disabled";
    case MediaResult::CONFIG_ERROR:
        return "Config Error";
    default:
        return "Unknown Error";
    }
}

/**
 * @brief Check if a failure should be recorded with an error marker
 *
 * Only failures caused by the source payload itself are memoized. A broken
 * file stays broken until it is replaced, so retrying costs a full decode or
 * transcode for nothing.
 */
[[nodiscard]] inline bool media_result_is_memoizable(MediaResult result) {
    switch (result) {
    case MediaResult::DECODE_ERROR:
    case MediaResult::EXTERNAL_TOOL_ERROR:
        return true;
    default:
        return false;
    }
}

/**
 * @brief Check if a failure may clear up on its own
 */
[[nodiscard]] inline bool media_result_is_transient(MediaResult result) {
    switch (result) {
    case MediaResult::NOT_FOUND:
    case MediaResult::FILE_LOCKED:
    case MediaResult::IO_ERROR:
        return true;
    default:
        return false;
    }
}

/**
 * @brief Detailed error information for media operations
 */
struct MediaError {
    MediaResult result;        ///< Primary error code
    std::string technical_msg; ///< Technical details for logging and error markers
    std::string user_msg;      ///< Short message suitable for a client response

    MediaError(MediaResult r = MediaResult::SUCCESS, const std::string& tech = "",
               const std::string& user = "")
        : result(r), technical_msg(tech), user_msg(user) {}

    [[nodiscard]] bool success() const {
        return result == MediaResult::SUCCESS;
    }

    operator bool() const {
        return success();
    }

    [[nodiscard]] bool is_memoizable() const {
        return media_result_is_memoizable(result);
    }

    [[nodiscard]] bool is_transient() const {
        return media_result_is_transient(result);
    }
};

/**
 * @brief Factory methods for common media errors
 *
 * Path escapes are reported to callers as "not found" in user_msg so that a
 * probing client learns nothing about the tree layout.
 */
class MediaErrorHelper {
  public:
    static MediaError success() {
        return MediaError(MediaResult::SUCCESS);
    }

    static MediaError path_escape(const std::string& path) {
        return MediaError(MediaResult::PATH_ESCAPE, "Path escapes root: " + path, "Not found");
    }

    static MediaError not_a_subpath(const std::string& root, const std::string& path) {
        return MediaError(MediaResult::NOT_A_SUBPATH, path + " is not a subpath of " + root,
                          "Not found");
    }

    static MediaError not_found(const std::string& path) {
        return MediaError(MediaResult::NOT_FOUND, "No such file or directory: " + path,
                          "Not found");
    }

    static MediaError no_extension(const std::string& path) {
        return MediaError(MediaResult::NO_EXTENSION, "File has no extension: " + path,
                          "Invalid media name");
    }

    static MediaError unsupported_type(const std::string& path, const std::string& operation) {
        return MediaError(MediaResult::UNSUPPORTED_TYPE, operation + " not supported for " + path,
                          "Unsupported media type");
    }

    static MediaError decode_error(const std::string& path, const std::string& detail) {
        return MediaError(MediaResult::DECODE_ERROR, "Unable to decode " + path + ": " + detail,
                          "Invalid media file");
    }

    static MediaError external_tool_error(const std::string& detail) {
        return MediaError(MediaResult::EXTERNAL_TOOL_ERROR, detail, "Video frame extraction failed");
    }

    static MediaError tool_unavailable(const std::string& command) {
        return MediaError(MediaResult::TOOL_UNAVAILABLE, command + " not found in PATH",
                          "Video thumbnails not supported");
    }

    static MediaError too_small(const std::string& path, int width, int height) {
        return MediaError(MediaResult::TOO_SMALL_FOR_PREVIEW,
                          path + " is only " + std::to_string(width) + "x" +
                              std::to_string(height),
                          "Image too small for preview");
    }

    static MediaError permanently_failed(const std::string& marker, const std::string& reason) {
        return MediaError(MediaResult::PERMANENTLY_FAILED,
                          "Error marker " + marker + (reason.empty() ? "" : ": " + reason),
                          "Previous generation failed");
    }

    static MediaError file_locked(const std::string& path) {
        return MediaError(MediaResult::FILE_LOCKED, path + " is locked by another process",
                          "File busy");
    }

    static MediaError io_error(const std::string& detail) {
        return MediaError(MediaResult::IO_ERROR, detail, "Storage error");
    }

    static MediaError disabled(const std::string& feature) {
        return MediaError(MediaResult::DISABLED, feature + " disabled", feature + " disabled");
    }

    static MediaError config_error(const std::string& detail) {
        return MediaError(MediaResult::CONFIG_ERROR, detail, "Invalid configuration");
    }
};

} // namespace mediashelf
