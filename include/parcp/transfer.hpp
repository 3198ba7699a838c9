// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file transfer.hpp
 * @brief Single-file transfer
 */

#ifndef PARCP_TRANSFER_HPP
#define PARCP_TRANSFER_HPP

#include <parcp/filesystem.hpp>
#include <parcp/options.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>

namespace parcp {

/**
 * Permission bits for directories created on behalf of a file
 *
 * The file's bits plus search permission wherever read is granted, so
 * 0644 gives 0755 and 0600 gives 0700.
 */
[[nodiscard]] constexpr mode_t directory_mode(mode_t file_mode) noexcept {
    mode_t bits = file_mode & 07777;
    return bits | ((bits & 0444) >> 2);
}

/**
 * Copy one file's bytes and permission bits
 *
 * Creates missing parent directories of @p to. An existing destination is
 * truncated; the caller decides beforehand whether overwriting is allowed.
 * On a CopyError the partially written destination is left in place.
 *
 * @param fs Filesystem to operate on
 * @param from Source file
 * @param to Destination file
 * @param buffer_size Chunk size for each read/write
 * @return Bytes copied
 * @throws OpenError, StatError, DirectoryCreationError, CreateError, CopyError
 */
uint64_t transfer_file(Filesystem &fs, const std::string &from, const std::string &to,
                       size_t buffer_size = kDefaultBufferSize);

} // namespace parcp

#endif // PARCP_TRANSFER_HPP
