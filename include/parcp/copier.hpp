// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file copier.hpp
 * @brief Recursive parallel copy entry point
 */

#ifndef PARCP_COPIER_HPP
#define PARCP_COPIER_HPP

#include <parcp/filesystem.hpp>
#include <parcp/options.hpp>
#include <parcp/stats.hpp>

#include <memory>
#include <string>

namespace parcp {

/**
 * Copies a file or directory tree, transferring files in parallel
 *
 * Semantics follow `cp -r from to`:
 * - from == to (after lexical cleaning) is a successful no-op.
 * - If to exists and clobbering is disabled, ClobberAvoidedError is thrown
 *   before anything is written.
 * - A regular file is copied directly; errors propagate as thrown by
 *   transfer_file().
 * - A directory is created at to, then every file under from is copied to
 *   the same relative path under to by a pool of workers. Per-file failures
 *   do not stop the other transfers; they are thrown together as Failures
 *   once the run is over.
 *
 * Copying a directory into its own descendant is rejected with
 * NestedCopyError. Copying into an ancestor is allowed and terminates:
 * each destination path is claimed once per call.
 *
 * copy() is const and keeps no state between calls, so one Copier can run
 * several copies concurrently provided the filesystem allows it.
 *
 * Example:
 * @code
 * parcp::Copier copier(parcp::Options().clobber(true).parallel(16));
 * try {
 *     auto stats = copier.copy("/data/in", "/backup/in");
 *     std::cout << stats.files_copied() << " files\n";
 * } catch (const parcp::Failures &f) {
 *     std::cerr << f.size() << " files failed:\n" << f.what() << "\n";
 * }
 * @endcode
 */
class Copier {
  public:
    /**
     * Create copier with default options
     *
     * Operates on the real filesystem, no clobbering, 10 workers.
     */
    Copier();

    /**
     * Create copier with custom options
     * @param opts Configuration options
     */
    explicit Copier(Options opts);

    /**
     * Run one copy
     *
     * @param from Source file or directory
     * @param to Destination path
     * @return Run statistics
     * @throws StatError, ClobberAvoidedError, NestedCopyError,
     *         DirectoryCreationError, the transfer_file() errors (single
     *         file), or Failures (directory)
     */
    CopyStats copy(const std::string &from, const std::string &to) const;

    [[nodiscard]] const Options &options() const noexcept { return opts_; }

    /// Filesystem in use (the shared OsFilesystem when none was configured)
    [[nodiscard]] Filesystem &filesystem() const noexcept { return *fs_; }

  private:
    void copy_tree(const std::string &from, const std::string &to,
                   detail::CopyCounters &counters) const;

    Options opts_;
    std::shared_ptr<Filesystem> fs_;
};

} // namespace parcp

#endif // PARCP_COPIER_HPP
