// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "media_error.h"

#include <string>

namespace mediashelf {

/**
 * @brief Path arithmetic against a trusted root
 *
 * All results use forward slashes regardless of the host separator. Checks
 * are purely lexical: `..` segments and absolute overrides are rejected,
 * symlinks pointing outside the root are not followed or detected.
 */
class PathResolver {
  public:
    /**
     * @brief Join @p relative onto @p root and verify it stays beneath it
     *
     * An empty relative path resolves to the root itself.
     *
     * @param root Trusted base directory
     * @param relative Untrusted relative path (client supplied)
     * @param full_path Output: normalized joined path
     * @return PATH_ESCAPE if the result is outside @p root
     */
    static MediaError resolve(const std::string& root, const std::string& relative,
                              std::string& full_path);

    /**
     * @brief Inverse of resolve()
     *
     * @param root Base directory
     * @param full_path Path expected to be beneath @p root
     * @param relative Output: slash-separated offset, empty when equal to root
     * @return NOT_A_SUBPATH if @p full_path is outside @p root
     */
    static MediaError relativize(const std::string& root, const std::string& full_path,
                                 std::string& relative);

    /// Lexically normalize and convert to forward slashes ("." for empty)
    static std::string normalize(const std::string& path);

    /// Join two relative keys, dropping an empty or "." prefix
    static std::string join(const std::string& base, const std::string& name);

    /// Parent of a relative key ("" at top level)
    static std::string parent(const std::string& relative);

    /// Last path component
    static std::string base_name(const std::string& path);
};

} // namespace mediashelf
