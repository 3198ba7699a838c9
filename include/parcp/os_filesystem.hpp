// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file os_filesystem.hpp
 * @brief Filesystem backed by the host operating system
 */

#ifndef PARCP_OS_FILESYSTEM_HPP
#define PARCP_OS_FILESYSTEM_HPP

#include <parcp/filesystem.hpp>

#include <memory>
#include <string>

namespace parcp {

/**
 * POSIX filesystem
 *
 * File bytes move through a per-thread io_uring ring (liburing), falling
 * back to pread/pwrite where io_uring is unavailable. Stateless apart from
 * those rings, so one instance serves every thread.
 */
class OsFilesystem : public Filesystem {
  public:
    /// Process-wide instance used when no filesystem is configured
    static std::shared_ptr<OsFilesystem> shared();

    FileInfo stat(const std::string &path) override;
    std::unique_ptr<ReadStream> open_read(const std::string &path) override;
    std::unique_ptr<WriteStream> open_write(const std::string &path, mode_t mode) override;
    void mkdir_all(const std::string &path, mode_t mode) override;
    void walk(const std::string &root, const WalkFn &visit) override;
    std::string resolve(const std::string &path) override;

  private:
    void walk_dir(const std::string &dir, const WalkFn &visit);
};

} // namespace parcp

#endif // PARCP_OS_FILESYSTEM_HPP
