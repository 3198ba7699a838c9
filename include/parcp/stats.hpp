// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file stats.hpp
 * @brief Copy run statistics
 */

#ifndef PARCP_STATS_HPP
#define PARCP_STATS_HPP

#include <atomic>
#include <cstdint>

namespace parcp {

namespace detail {

/// Live counters shared by the walker and the workers of one copy.
struct CopyCounters {
    std::atomic<uint64_t> files_copied{0};
    std::atomic<uint64_t> bytes_copied{0};
    std::atomic<uint64_t> files_failed{0};
    std::atomic<uint64_t> duplicates_skipped{0};
    std::atomic<uint64_t> special_skipped{0};
};

} // namespace detail

/**
 * Summary of one Copier::copy() call
 *
 * Provides read-only access to the run's counters.
 */
class CopyStats {
  public:
    CopyStats() = default;

    CopyStats(const detail::CopyCounters &c, int64_t elapsed_ns) noexcept
        : files_copied_(c.files_copied.load()), bytes_copied_(c.bytes_copied.load()),
          files_failed_(c.files_failed.load()), duplicates_skipped_(c.duplicates_skipped.load()),
          special_skipped_(c.special_skipped.load()), elapsed_ns_(elapsed_ns) {}

    /**
     * Get files transferred successfully
     * @return Number of files copied
     */
    [[nodiscard]] uint64_t files_copied() const noexcept { return files_copied_; }

    /**
     * Get total bytes written to destination files
     * @return Bytes copied
     */
    [[nodiscard]] uint64_t bytes_copied() const noexcept { return bytes_copied_; }

    /**
     * Get files whose transfer failed
     * @return Number of failed transfers
     */
    [[nodiscard]] uint64_t files_failed() const noexcept { return files_failed_; }

    /**
     * Get walk entries skipped because their destination was already claimed
     * @return Duplicate destinations skipped
     */
    [[nodiscard]] uint64_t duplicates_skipped() const noexcept { return duplicates_skipped_; }

    /**
     * Get FIFOs, sockets and devices skipped by the walk
     * @return Special files skipped
     */
    [[nodiscard]] uint64_t special_skipped() const noexcept { return special_skipped_; }

    /**
     * Get wall-clock duration of the copy
     * @return Elapsed nanoseconds
     */
    [[nodiscard]] int64_t elapsed_ns() const noexcept { return elapsed_ns_; }

  private:
    uint64_t files_copied_ = 0;
    uint64_t bytes_copied_ = 0;
    uint64_t files_failed_ = 0;
    uint64_t duplicates_skipped_ = 0;
    uint64_t special_skipped_ = 0;
    int64_t elapsed_ns_ = 0;
};

} // namespace parcp

#endif // PARCP_STATS_HPP
