// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file walker.hpp
 * @brief Source tree walker producing transfer jobs
 */

#ifndef PARCP_WALKER_HPP
#define PARCP_WALKER_HPP

#include <parcp/channel.hpp>
#include <parcp/filesystem.hpp>
#include <parcp/seen_set.hpp>
#include <parcp/stats.hpp>

#include <exception>
#include <string>

namespace parcp {

/**
 * One file to transfer
 */
struct Job {
    std::string from; ///< Source file
    std::string to;   ///< Destination file
};

/**
 * Walks a source directory and feeds one Job per file into a channel
 *
 * Directories are not emitted; they come into being when a transfer creates
 * its parents. A destination already claimed in the SeenSet is skipped.
 *
 * On a traversal failure a single WalkError is sent to the failure channel
 * and the walk stops. Whatever happens, run() closes the job channel exactly
 * once before returning.
 */
class TreeWalker {
  public:
    /**
     * @param fs Filesystem to walk
     * @param from Cleaned source root
     * @param to Cleaned destination root
     * @param seen Claimed destinations for this copy
     * @param jobs Job channel (closed by run())
     * @param failures Failure channel (must be drained concurrently)
     * @param counters Run counters
     */
    TreeWalker(Filesystem &fs, std::string from, std::string to, SeenSet &seen,
               Channel<Job> &jobs, Channel<std::exception_ptr> &failures,
               detail::CopyCounters &counters);

    TreeWalker(const TreeWalker &) = delete;
    TreeWalker &operator=(const TreeWalker &) = delete;

    /// Walk the tree. Never throws.
    void run() noexcept;

  private:
    void visit(const std::string &path, const FileInfo &info);
    void report(std::exception_ptr failure);

    Filesystem &fs_;
    std::string from_;
    std::string to_;
    SeenSet &seen_;
    Channel<Job> &jobs_;
    Channel<std::exception_ptr> &failures_;
    detail::CopyCounters &counters_;
};

} // namespace parcp

#endif // PARCP_WALKER_HPP
