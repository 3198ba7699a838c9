// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file path.hpp
 * @brief Lexical path helpers
 *
 * Pure string manipulation over '/'-separated paths. Nothing here touches
 * the filesystem, so symbolic links are not resolved.
 */

#ifndef PARCP_PATH_HPP
#define PARCP_PATH_HPP

#include <string>
#include <string_view>

namespace parcp::path {

/**
 * Lexically normalize a path
 *
 * Collapses repeated slashes, drops "." segments, resolves ".." against the
 * preceding segment and strips trailing slashes. "" becomes ".".
 * ".." above "/" is dropped; leading ".." of a relative path is kept.
 */
[[nodiscard]] std::string clean(std::string_view p);

/// Join two paths and clean the result.
[[nodiscard]] std::string join(std::string_view dir, std::string_view name);

/// Parent directory of a path ("." for a bare name, "/" for "/x").
[[nodiscard]] std::string parent(std::string_view p);

/**
 * Path of p relative to root
 *
 * @param root Cleaned root
 * @param p Cleaned path equal to or under root
 * @return Remainder without leading slash; "" when p == root
 */
[[nodiscard]] std::string relative(std::string_view root, std::string_view p);

/**
 * True when child is strictly below ancestor
 *
 * Both arguments are cleaned first. A path is not within itself.
 */
[[nodiscard]] bool is_within(std::string_view child, std::string_view ancestor);

} // namespace parcp::path

#endif // PARCP_PATH_HPP
