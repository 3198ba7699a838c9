// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file io_ring.cpp
 * @brief io_uring ring management
 */

#include "io_ring.hpp"

#include <parcp/log.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

namespace parcp::detail {

namespace {

// Log the fallback once per process, not once per thread.
std::atomic<bool> g_fallback_logged{false};

// Setup alone succeeds on 5.1-5.5 kernels, which lack READ/WRITE (and the
// probe itself), so ask before trusting the ring.
bool supports_read_write(struct io_uring *ring) noexcept {
    struct io_uring_probe *probe = io_uring_get_probe_ring(ring);
    if (!probe) return false;
    bool ok = io_uring_opcode_supported(probe, IORING_OP_READ) &&
              io_uring_opcode_supported(probe, IORING_OP_WRITE);
    io_uring_free_probe(probe);
    return ok;
}

} // namespace

IoRing::IoRing(unsigned entries) noexcept {
    std::memset(&ring_, 0, sizeof(ring_));
    int ret = io_uring_queue_init(entries, &ring_, 0);
    if (ret == 0) {
        if (supports_read_write(&ring_)) {
            initialized_ = true;
            return;
        }
        io_uring_queue_exit(&ring_);
        ret = -EOPNOTSUPP;
    }
    if (!g_fallback_logged.exchange(true)) {
        log_emit(LogLevel::Notice, std::string("io_uring unavailable (") + strerror(-ret) +
                                       "), using pread/pwrite");
    }
}

IoRing::~IoRing() {
    if (initialized_) io_uring_queue_exit(&ring_);
}

IoRing &IoRing::for_this_thread() {
    thread_local IoRing ring;
    return ring;
}

ssize_t IoRing::read(int fd, void *buf, size_t len, off_t offset) noexcept {
    if (!initialized_) {
        ssize_t n;
        do {
            n = ::pread(fd, buf, len, offset);
        } while (n < 0 && errno == EINTR);
        return n < 0 ? -errno : n;
    }

    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) return -EAGAIN;
    io_uring_prep_read(sqe, fd, buf, static_cast<unsigned>(len), static_cast<__u64>(offset));
    return complete();
}

ssize_t IoRing::write(int fd, const void *buf, size_t len, off_t offset) noexcept {
    if (!initialized_) {
        ssize_t n;
        do {
            n = ::pwrite(fd, buf, len, offset);
        } while (n < 0 && errno == EINTR);
        return n < 0 ? -errno : n;
    }

    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    if (!sqe) return -EAGAIN;
    io_uring_prep_write(sqe, fd, buf, static_cast<unsigned>(len), static_cast<__u64>(offset));
    return complete();
}

ssize_t IoRing::complete() noexcept {
    int ret = io_uring_submit(&ring_);
    if (ret < 0) return ret;

    struct io_uring_cqe *cqe = nullptr;
    do {
        ret = io_uring_wait_cqe(&ring_, &cqe);
    } while (ret == -EINTR);
    if (ret < 0) return ret;

    ssize_t res = cqe->res;
    io_uring_cqe_seen(&ring_, cqe);
    return res;
}

} // namespace parcp::detail
