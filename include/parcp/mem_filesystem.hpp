// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file mem_filesystem.hpp
 * @brief In-memory filesystem
 */

#ifndef PARCP_MEM_FILESYSTEM_HPP
#define PARCP_MEM_FILESYSTEM_HPP

#include <parcp/filesystem.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace parcp {

namespace detail {
struct MemFileData;
} // namespace detail

/// Operations that can be made to fail on a MemFilesystem
enum class MemOp {
    Stat,   ///< stat()
    Open,   ///< open_read()
    Read,   ///< ReadStream::read() on a stream opened for the path
    Create, ///< open_write()
    Write,  ///< WriteStream::write() on a stream opened for the path
    Mkdir,  ///< mkdir_all() called with exactly this path
    List    ///< listing the directory during walk()
};

/**
 * Thread-safe filesystem held entirely in memory
 *
 * Paths are cleaned lexically, so "a//b/" and "a/b" name the same entry.
 * "/" and "." always exist as directories. There are no symbolic links and
 * no working directory, so resolve() only cleans the path.
 *
 * Faults can be injected per (operation, path) to exercise error paths:
 * @code
 * auto fs = std::make_shared<parcp::MemFilesystem>();
 * fs->write_file("/src/a.txt", "hello");
 * fs->inject_fault(parcp::MemOp::Open, "/src/a.txt", EACCES);
 * @endcode
 */
class MemFilesystem : public Filesystem {
  public:
    MemFilesystem() = default;

    MemFilesystem(const MemFilesystem &) = delete;
    MemFilesystem &operator=(const MemFilesystem &) = delete;

    FileInfo stat(const std::string &path) override;
    std::unique_ptr<ReadStream> open_read(const std::string &path) override;
    std::unique_ptr<WriteStream> open_write(const std::string &path, mode_t mode) override;
    void mkdir_all(const std::string &path, mode_t mode) override;
    void walk(const std::string &root, const WalkFn &visit) override;
    std::string resolve(const std::string &path) override;

    /**
     * Create or replace a file, creating parents with mode 0755
     * @throws Error (ENOTDIR, EISDIR)
     */
    void write_file(const std::string &path, std::string_view content, mode_t mode = 0644);

    /**
     * Whole content of a file
     * @throws Error (ENOENT, EISDIR)
     */
    [[nodiscard]] std::string read_file(const std::string &path) const;

    [[nodiscard]] bool exists(const std::string &path) const;

    /// Number of entries, excluding the implicit roots
    [[nodiscard]] size_t entry_count() const;

    /// Make op on path fail with err until cleared
    void inject_fault(MemOp op, const std::string &path, int err);

    void clear_faults();

  private:
    struct Node {
        FileType type = FileType::Regular;
        mode_t mode = 0;
        std::shared_ptr<detail::MemFileData> data; // null for directories
    };

    [[nodiscard]] const Node *find(const std::string &p) const;
    [[nodiscard]] int fault(MemOp op, const std::string &p) const;
    void mkdir_all_locked(const std::string &p, mode_t mode);
    std::shared_ptr<detail::MemFileData> create_locked(const std::string &p, mode_t mode);
    void walk_dir(const std::string &dir, const WalkFn &visit);

    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_;
    std::map<std::pair<MemOp, std::string>, int> faults_;
};

} // namespace parcp

#endif // PARCP_MEM_FILESYSTEM_HPP
