// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file options.hpp
 * @brief Options builder class for parcp
 */

#ifndef PARCP_OPTIONS_HPP
#define PARCP_OPTIONS_HPP

#include <parcp/fwd.hpp>

#include <cstddef>
#include <memory>
#include <utility>

namespace parcp {

/// Worker count used when parallel() is unset or not positive
inline constexpr int kDefaultParallel = 10;

/// Transfer chunk size used when buffer_size() is unset
inline constexpr size_t kDefaultBufferSize = 256 * 1024; // 256 KiB

/**
 * Copier configuration options
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * parcp::Options opts;
 * opts.clobber(true)
 *     .parallel(16)
 *     .filesystem(std::make_shared<parcp::MemFilesystem>());
 *
 * parcp::Copier copier(opts);
 * @endcode
 */
class Options {
  public:
    /**
     * Set the filesystem to operate on
     * @param fs Filesystem (nullptr = the real OS filesystem)
     * @return Reference to this for chaining
     */
    Options &filesystem(std::shared_ptr<Filesystem> fs) noexcept {
        fs_ = std::move(fs);
        return *this;
    }

    /**
     * Allow copying over an existing destination
     * @param enable True to overwrite existing files (default: false)
     * @return Reference to this for chaining
     */
    Options &clobber(bool enable) noexcept {
        clobber_ = enable;
        return *this;
    }

    /**
     * Set number of parallel workers
     *
     * Each worker holds two open files while it copies, so keep this below
     * the process descriptor limit.
     *
     * @param workers Worker count (<= 0 = default of 10)
     * @return Reference to this for chaining
     */
    Options &parallel(int workers) noexcept {
        parallel_ = workers;
        return *this;
    }

    /**
     * Set per-transfer chunk size
     * @param bytes Chunk size in bytes (0 = default of 256 KiB)
     * @return Reference to this for chaining
     */
    Options &buffer_size(size_t bytes) noexcept {
        buffer_size_ = bytes;
        return *this;
    }

    // Getters
    [[nodiscard]] const std::shared_ptr<Filesystem> &filesystem() const noexcept { return fs_; }
    [[nodiscard]] bool clobber() const noexcept { return clobber_; }
    [[nodiscard]] int parallel() const noexcept { return parallel_; }
    [[nodiscard]] size_t buffer_size() const noexcept { return buffer_size_; }

    [[nodiscard]] int effective_parallel() const noexcept {
        return parallel_ > 0 ? parallel_ : kDefaultParallel;
    }
    [[nodiscard]] size_t effective_buffer_size() const noexcept {
        return buffer_size_ > 0 ? buffer_size_ : kDefaultBufferSize;
    }

  private:
    std::shared_ptr<Filesystem> fs_;
    bool clobber_ = false;
    int parallel_ = 0;
    size_t buffer_size_ = 0;
};

} // namespace parcp

#endif // PARCP_OPTIONS_HPP
