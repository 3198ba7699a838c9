// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file os_filesystem.cpp
 * @brief Filesystem backed by the host operating system
 */

#include <parcp/error.hpp>
#include <parcp/os_filesystem.hpp>
#include <parcp/path.hpp>

#include "io_ring.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace parcp {

namespace {

// Largest single request handed to the ring (its length field is 32-bit).
constexpr size_t kMaxIoChunk = 1u << 30;

FileInfo to_info(const struct stat &st) noexcept {
    FileInfo info;
    if (S_ISDIR(st.st_mode)) info.type = FileType::Directory;
    else if (S_ISREG(st.st_mode)) info.type = FileType::Regular;
    else if (S_ISLNK(st.st_mode)) info.type = FileType::Symlink;
    else info.type = FileType::Other;
    info.mode = st.st_mode & 07777;
    info.size = static_cast<uint64_t>(st.st_size);
    return info;
}

class OsReadStream : public ReadStream {
  public:
    OsReadStream(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~OsReadStream() override { ::close(fd_); }

    OsReadStream(const OsReadStream &) = delete;
    OsReadStream &operator=(const OsReadStream &) = delete;

    size_t read(std::span<std::byte> buf) override {
        size_t len = std::min(buf.size(), kMaxIoChunk);
        ssize_t n = detail::IoRing::for_this_thread().read(fd_, buf.data(), len, offset_);
        if (n < 0) throw Error(static_cast<int>(-n), "read", path_);
        offset_ += n;
        return static_cast<size_t>(n);
    }

  private:
    int fd_;
    std::string path_;
    off_t offset_ = 0;
};

class OsWriteStream : public WriteStream {
  public:
    OsWriteStream(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
    ~OsWriteStream() override {
        if (fd_ >= 0) ::close(fd_);
    }

    OsWriteStream(const OsWriteStream &) = delete;
    OsWriteStream &operator=(const OsWriteStream &) = delete;

    void write(std::span<const std::byte> buf) override {
        if (fd_ < 0) throw Error(EBADF, "write after close", path_);
        auto &ring = detail::IoRing::for_this_thread();
        while (!buf.empty()) {
            size_t len = std::min(buf.size(), kMaxIoChunk);
            ssize_t n = ring.write(fd_, buf.data(), len, offset_);
            if (n < 0) throw Error(static_cast<int>(-n), "write", path_);
            if (n == 0) throw Error(EIO, "short write", path_);
            offset_ += n;
            buf = buf.subspan(static_cast<size_t>(n));
        }
    }

    void close() override {
        if (fd_ < 0) return;
        int fd = fd_;
        fd_ = -1;
        check(::close(fd) == 0, "close", path_);
    }

  private:
    int fd_;
    std::string path_;
    off_t offset_ = 0;
};

struct DirCloser {
    void operator()(DIR *d) const noexcept { closedir(d); }
};

struct FreeDeleter {
    void operator()(char *p) const noexcept { free(p); }
};

using CString = std::unique_ptr<char, FreeDeleter>;

} // namespace

std::shared_ptr<OsFilesystem> OsFilesystem::shared() {
    static std::shared_ptr<OsFilesystem> instance = std::make_shared<OsFilesystem>();
    return instance;
}

FileInfo OsFilesystem::stat(const std::string &path) {
    struct stat st;
    check(::stat(path.c_str(), &st) == 0, "stat", path);
    return to_info(st);
}

std::unique_ptr<ReadStream> OsFilesystem::open_read(const std::string &path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    check(fd >= 0, "open", path);
    return std::make_unique<OsReadStream>(fd, path);
}

std::unique_ptr<WriteStream> OsFilesystem::open_write(const std::string &path, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode & 07777);
    check(fd >= 0, "open", path);
    // The open() mode only applies to new files; an overwritten file keeps
    // its old bits unless changed here.
    if (fchmod(fd, mode & 07777) != 0) {
        int err = errno;
        ::close(fd);
        throw Error(err, "fchmod", path);
    }
    return std::make_unique<OsWriteStream>(fd, path);
}

void OsFilesystem::mkdir_all(const std::string &path, mode_t mode) {
    const std::string dir = path::clean(path);

    struct stat st;
    if (::stat(dir.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return;
        throw Error(ENOTDIR, "mkdir", dir);
    }

    std::string up = path::parent(dir);
    if (up != dir) mkdir_all(up, mode);

    if (::mkdir(dir.c_str(), mode & 07777) != 0) {
        int err = errno;
        // Another worker may have created it in the meantime.
        if (err == EEXIST && ::stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) return;
        throw Error(err, "mkdir", dir);
    }
}

void OsFilesystem::walk(const std::string &root, const WalkFn &visit) {
    // The root follows links like stat() does; entries below it do not.
    struct stat st;
    check(::stat(root.c_str(), &st) == 0, "stat", root);
    FileInfo info = to_info(st);
    visit(root, info);
    if (info.is_directory()) walk_dir(root, visit);
}

void OsFilesystem::walk_dir(const std::string &dir, const WalkFn &visit) {
    std::vector<std::string> names;
    {
        std::unique_ptr<DIR, DirCloser> d(opendir(dir.c_str()));
        check(d != nullptr, "opendir", dir);

        while (true) {
            errno = 0;
            struct dirent *ent = readdir(d.get());
            if (!ent) {
                check(errno == 0, "readdir", dir);
                break;
            }
            std::string name(ent->d_name);
            if (name == "." || name == "..") continue;
            names.push_back(std::move(name));
        }
    }
    std::sort(names.begin(), names.end());

    for (const auto &name : names) {
        std::string child = path::join(dir, name);
        struct stat st;
        check(::lstat(child.c_str(), &st) == 0, "lstat", child);
        FileInfo info = to_info(st);
        visit(child, info);
        if (info.is_directory()) walk_dir(child, visit);
    }
}

std::string OsFilesystem::resolve(const std::string &path) {
    std::string abs = path::clean(path);
    if (abs.front() != '/') {
        CString cwd(::getcwd(nullptr, 0));
        check(cwd != nullptr, "getcwd", path);
        abs = path::join(cwd.get(), abs);
    }

    // Walk up until realpath() succeeds; the missing tail is kept as written.
    std::string head = abs;
    std::string tail;
    while (true) {
        CString real(::realpath(head.c_str(), nullptr));
        if (real) return tail.empty() ? std::string(real.get()) : path::join(real.get(), tail);

        int err = errno;
        if (err != ENOENT && err != ENOTDIR) throw Error(err, "realpath", head);

        std::string up = path::parent(head);
        if (up == head) return abs;
        std::string name = path::relative(up, head);
        tail = tail.empty() ? name : path::join(name, tail);
        head = std::move(up);
    }
}

} // namespace parcp
