// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file seen_set.hpp
 * @brief Destination paths already claimed by one directory copy
 */

#ifndef PARCP_SEEN_SET_HPP
#define PARCP_SEEN_SET_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace parcp {

/**
 * Thread-safe set of claimed destination paths
 *
 * A destination is enqueued for copying only by the caller whose claim()
 * succeeded, so each destination is written at most once per copy even when
 * the walk meets it again (destination tree nested in the source tree).
 * One instance lives for exactly one directory copy.
 */
class SeenSet {
  public:
    SeenSet() = default;

    SeenSet(const SeenSet &) = delete;
    SeenSet &operator=(const SeenSet &) = delete;

    /**
     * Atomically check and insert
     *
     * @param path Destination path
     * @return true if path was not present and is now claimed
     */
    bool claim(const std::string &path);

    [[nodiscard]] bool contains(const std::string &path) const;
    [[nodiscard]] size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> paths_;
};

} // namespace parcp

#endif // PARCP_SEEN_SET_HPP
