// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file mem_filesystem.cpp
 * @brief In-memory filesystem
 */

#include <parcp/error.hpp>
#include <parcp/mem_filesystem.hpp>
#include <parcp/path.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace parcp {

struct detail::MemFileData {
    std::mutex mutex;
    std::string bytes;
};

namespace {

bool is_root(const std::string &p) noexcept {
    return p == "/" || p == ".";
}

class MemReadStream : public ReadStream {
  public:
    MemReadStream(std::string content, std::string path, int fail)
        : content_(std::move(content)), path_(std::move(path)), fail_(fail) {}

    size_t read(std::span<std::byte> buf) override {
        if (fail_) throw Error(fail_, "read", path_);
        size_t n = std::min(buf.size(), content_.size() - offset_);
        std::memcpy(buf.data(), content_.data() + offset_, n);
        offset_ += n;
        return n;
    }

  private:
    std::string content_; // snapshot taken at open
    std::string path_;
    int fail_;
    size_t offset_ = 0;
};

class MemWriteStream : public WriteStream {
  public:
    MemWriteStream(std::shared_ptr<detail::MemFileData> data, std::string path, int fail)
        : data_(std::move(data)), path_(std::move(path)), fail_(fail) {}

    void write(std::span<const std::byte> buf) override {
        if (fail_) throw Error(fail_, "write", path_);
        if (!data_) throw Error(EBADF, "write after close", path_);
        std::lock_guard<std::mutex> lock(data_->mutex);
        data_->bytes.append(reinterpret_cast<const char *>(buf.data()), buf.size());
    }

    void close() override { data_.reset(); }

  private:
    std::shared_ptr<detail::MemFileData> data_;
    std::string path_;
    int fail_;
};

} // namespace

const MemFilesystem::Node *MemFilesystem::find(const std::string &p) const {
    static const Node root{FileType::Directory, 0755, nullptr};
    if (is_root(p)) return &root;
    auto it = nodes_.find(p);
    return it == nodes_.end() ? nullptr : &it->second;
}

int MemFilesystem::fault(MemOp op, const std::string &p) const {
    auto it = faults_.find({op, p});
    return it == faults_.end() ? 0 : it->second;
}

std::string MemFilesystem::resolve(const std::string &path) {
    return path::clean(path);
}

FileInfo MemFilesystem::stat(const std::string &path) {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (int err = fault(MemOp::Stat, p)) throw Error(err, "stat", p);

    const Node *node = find(p);
    if (!node) throw Error(ENOENT, "stat", p);

    FileInfo info;
    info.type = node->type;
    info.mode = node->mode;
    if (node->data) {
        std::lock_guard<std::mutex> data_lock(node->data->mutex);
        info.size = node->data->bytes.size();
    }
    return info;
}

std::unique_ptr<ReadStream> MemFilesystem::open_read(const std::string &path) {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (int err = fault(MemOp::Open, p)) throw Error(err, "open", p);

    const Node *node = find(p);
    if (!node) throw Error(ENOENT, "open", p);
    if (node->type == FileType::Directory) throw Error(EISDIR, "open", p);

    std::string content;
    {
        std::lock_guard<std::mutex> data_lock(node->data->mutex);
        content = node->data->bytes;
    }
    return std::make_unique<MemReadStream>(std::move(content), p, fault(MemOp::Read, p));
}

std::unique_ptr<WriteStream> MemFilesystem::open_write(const std::string &path, mode_t mode) {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (int err = fault(MemOp::Create, p)) throw Error(err, "open", p);

    auto data = create_locked(p, mode);
    return std::make_unique<MemWriteStream>(std::move(data), p, fault(MemOp::Write, p));
}

std::shared_ptr<detail::MemFileData> MemFilesystem::create_locked(const std::string &p,
                                                                  mode_t mode) {
    if (is_root(p)) throw Error(EISDIR, "open", p);

    const Node *up = find(path::parent(p));
    if (!up) throw Error(ENOENT, "open", p);
    if (up->type != FileType::Directory) throw Error(ENOTDIR, "open", p);

    auto it = nodes_.find(p);
    if (it != nodes_.end() && it->second.type == FileType::Directory) {
        throw Error(EISDIR, "open", p);
    }

    Node &node = nodes_[p];
    // Truncation swaps in fresh storage; readers keep their snapshot.
    node.type = FileType::Regular;
    node.mode = mode & 07777;
    node.data = std::make_shared<detail::MemFileData>();
    return node.data;
}

void MemFilesystem::mkdir_all(const std::string &path, mode_t mode) {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (int err = fault(MemOp::Mkdir, p)) throw Error(err, "mkdir", p);
    mkdir_all_locked(p, mode);
}

void MemFilesystem::mkdir_all_locked(const std::string &p, mode_t mode) {
    const Node *node = find(p);
    if (node) {
        if (node->type == FileType::Directory) return;
        throw Error(ENOTDIR, "mkdir", p);
    }

    mkdir_all_locked(path::parent(p), mode);

    Node dir;
    dir.type = FileType::Directory;
    dir.mode = mode & 07777;
    nodes_.emplace(p, std::move(dir));
}

void MemFilesystem::walk(const std::string &root, const WalkFn &visit) {
    const std::string p = path::clean(root);
    FileInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const Node *node = find(p);
        if (!node) throw Error(ENOENT, "lstat", p);
        info.type = node->type;
        info.mode = node->mode;
    }
    visit(p, info);
    if (info.is_directory()) walk_dir(p, visit);
}

void MemFilesystem::walk_dir(const std::string &dir, const WalkFn &visit) {
    std::vector<std::pair<std::string, FileInfo>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (int err = fault(MemOp::List, dir)) throw Error(err, "opendir", dir);

        // Children of dir share the prefix "dir/" and sit together in the map.
        std::string prefix = dir == "." ? std::string() : (dir == "/" ? dir : dir + "/");
        for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            if (path::parent(it->first) != dir) continue;
            FileInfo info;
            info.type = it->second.type;
            info.mode = it->second.mode;
            children.emplace_back(it->first, info);
        }
    }

    for (const auto &[child, info] : children) {
        visit(child, info);
        if (info.is_directory()) walk_dir(child, visit);
    }
}

void MemFilesystem::write_file(const std::string &path, std::string_view content, mode_t mode) {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    mkdir_all_locked(path::parent(p), 0755);
    auto data = create_locked(p, mode);
    data->bytes.assign(content.data(), content.size());
}

std::string MemFilesystem::read_file(const std::string &path) const {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    const Node *node = find(p);
    if (!node) throw Error(ENOENT, "read", p);
    if (node->type == FileType::Directory) throw Error(EISDIR, "read", p);
    std::lock_guard<std::mutex> data_lock(node->data->mutex);
    return node->data->bytes;
}

bool MemFilesystem::exists(const std::string &path) const {
    const std::string p = path::clean(path);
    std::lock_guard<std::mutex> lock(mutex_);
    return find(p) != nullptr;
}

size_t MemFilesystem::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

void MemFilesystem::inject_fault(MemOp op, const std::string &path, int err) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_[{op, path::clean(path)}] = err;
}

void MemFilesystem::clear_faults() {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.clear();
}

} // namespace parcp
