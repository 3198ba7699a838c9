// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file filesystem.hpp
 * @brief Filesystem abstraction used by the copy engine
 *
 * The copy engine touches storage only through this interface, so the same
 * engine runs against the real OS filesystem (OsFilesystem) or an in-memory
 * one (MemFilesystem). Implementations must be safe for concurrent use: many
 * worker threads open, read, write and create directories at once.
 *
 * Failures are reported by throwing parcp::Error carrying the errno value.
 */

#ifndef PARCP_FILESYSTEM_HPP
#define PARCP_FILESYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include <sys/types.h>

namespace parcp {

/// Kind of filesystem entry
enum class FileType {
    Regular,   ///< Regular file
    Directory, ///< Directory
    Symlink,   ///< Symbolic link (reported by walk, which does not follow links)
    Other      ///< FIFO, socket, device
};

/**
 * Metadata for one filesystem entry
 */
struct FileInfo {
    FileType type = FileType::Regular;
    mode_t mode = 0;   ///< Permission bits (07777)
    uint64_t size = 0; ///< Size in bytes (regular files)

    [[nodiscard]] bool is_directory() const noexcept { return type == FileType::Directory; }
    [[nodiscard]] bool is_regular() const noexcept { return type == FileType::Regular; }
};

/**
 * Sequential reader over an open file
 */
class ReadStream {
  public:
    virtual ~ReadStream() = default;

    /**
     * Read the next bytes
     *
     * @param buf Destination buffer
     * @return Bytes read; 0 at end of file
     * @throws Error on I/O failure
     */
    virtual size_t read(std::span<std::byte> buf) = 0;
};

/**
 * Sequential writer over an open file
 */
class WriteStream {
  public:
    virtual ~WriteStream() = default;

    /**
     * Write all of buf
     * @throws Error on I/O failure
     */
    virtual void write(std::span<const std::byte> buf) = 0;

    /**
     * Finish the file and release it
     *
     * Errors surfaced at close (deferred write-back, quota) are thrown here.
     * The destructor closes silently if close() was never called.
     *
     * @throws Error on failure
     */
    virtual void close() = 0;
};

/**
 * Walk visitor
 *
 * Called once per entry, root first, parents before children. Throwing from
 * the visitor stops the walk and propagates out of Filesystem::walk().
 */
using WalkFn = std::function<void(const std::string &path, const FileInfo &info)>;

/**
 * Minimal filesystem capability set
 */
class Filesystem {
  public:
    virtual ~Filesystem() = default;

    /**
     * Read metadata, following symbolic links
     * @throws Error (ENOENT when missing)
     */
    virtual FileInfo stat(const std::string &path) = 0;

    /**
     * Open a file for reading
     * @throws Error
     */
    virtual std::unique_ptr<ReadStream> open_read(const std::string &path) = 0;

    /**
     * Create or truncate a file for writing
     *
     * The file ends up with the given permission bits even when it already
     * existed.
     *
     * @throws Error
     */
    virtual std::unique_ptr<WriteStream> open_write(const std::string &path, mode_t mode) = 0;

    /**
     * Create a directory and any missing parents
     *
     * Succeeds when the directory already exists.
     *
     * @throws Error (ENOTDIR when a component is not a directory)
     */
    virtual void mkdir_all(const std::string &path, mode_t mode) = 0;

    /**
     * Walk the tree rooted at root depth-first
     *
     * A symbolic link given as root is followed; links below the root are
     * reported as FileType::Symlink and not descended into.
     * Entries within a directory are visited in byte-wise lexical order.
     * Directory listings are read when the walk reaches them, so entries
     * created during the walk may or may not be seen.
     *
     * @throws Error on traversal failure, or whatever the visitor throws
     */
    virtual void walk(const std::string &root, const WalkFn &visit) = 0;

    /**
     * Canonical spelling of a path
     *
     * Two paths naming the same entry resolve to the same string, however
     * they were spelled (relative or absolute, through symbolic links). The
     * path need not exist: the longest existing prefix is resolved and the
     * rest is appended lexically.
     *
     * @throws Error when an existing prefix cannot be resolved
     */
    virtual std::string resolve(const std::string &path) = 0;
};

} // namespace parcp

#endif // PARCP_FILESYSTEM_HPP
