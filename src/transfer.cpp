// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file transfer.cpp
 * @brief Single-file transfer
 */

#include <parcp/error.hpp>
#include <parcp/path.hpp>
#include <parcp/transfer.hpp>

#include <memory>
#include <span>
#include <vector>

namespace parcp {

uint64_t transfer_file(Filesystem &fs, const std::string &from, const std::string &to,
                       size_t buffer_size) {
    if (buffer_size == 0) buffer_size = kDefaultBufferSize;

    std::unique_ptr<ReadStream> in;
    try {
        in = fs.open_read(from);
    } catch (const Error &e) {
        throw OpenError(from, e.code());
    }

    FileInfo info;
    try {
        info = fs.stat(from);
    } catch (const Error &e) {
        throw StatError(from, e.code());
    }

    try {
        fs.mkdir_all(path::parent(to), directory_mode(info.mode));
    } catch (const Error &e) {
        throw DirectoryCreationError(to, e.code());
    }

    std::unique_ptr<WriteStream> out;
    try {
        out = fs.open_write(to, info.mode & 07777);
    } catch (const Error &e) {
        throw CreateError(to, e.code());
    }

    std::vector<std::byte> buf(buffer_size);
    uint64_t total = 0;
    try {
        while (true) {
            size_t n = in->read(std::span<std::byte>(buf));
            if (n == 0) break;
            out->write(std::span<const std::byte>(buf.data(), n));
            total += n;
        }
        out->close();
    } catch (const Error &e) {
        throw CopyError(from, to, e.code());
    }
    return total;
}

} // namespace parcp
