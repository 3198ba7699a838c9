// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file io_ring.hpp
 * @brief io_uring ring management
 *
 * Internal header - not part of public API.
 */

#ifndef PARCP_IO_RING_HPP
#define PARCP_IO_RING_HPP

#include <cstddef>

#include <liburing.h>
#include <sys/types.h>

namespace parcp::detail {

/**
 * One io_uring ring used for synchronous positional I/O
 *
 * Each call submits one SQE and waits for its completion. When the kernel
 * refuses ring setup (ENOSYS on old kernels, EPERM under seccomp policies
 * that block io_uring), or offers no READ/WRITE opcodes, the ring stays
 * inactive and calls fall back to pread/pwrite.
 *
 * Not thread-safe: use one ring per thread (see for_this_thread()).
 */
class IoRing {
  public:
    explicit IoRing(unsigned entries = 8) noexcept;
    ~IoRing();

    IoRing(const IoRing &) = delete;
    IoRing &operator=(const IoRing &) = delete;

    /// Ring of the calling thread, created on first use
    static IoRing &for_this_thread();

    /// True when requests go through io_uring
    [[nodiscard]] bool active() const noexcept { return initialized_; }

    /**
     * Read up to len bytes at offset
     * @return Bytes read (0 at EOF) or negative errno
     */
    ssize_t read(int fd, void *buf, size_t len, off_t offset) noexcept;

    /**
     * Write up to len bytes at offset
     * @return Bytes written or negative errno
     */
    ssize_t write(int fd, const void *buf, size_t len, off_t offset) noexcept;

  private:
    ssize_t complete() noexcept;

    struct io_uring ring_;
    bool initialized_ = false;
};

} // namespace parcp::detail

#endif // PARCP_IO_RING_HPP
