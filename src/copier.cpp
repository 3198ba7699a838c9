// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file copier.cpp
 * @brief Recursive parallel copy entry point
 */

#include <parcp/channel.hpp>
#include <parcp/copier.hpp>
#include <parcp/error.hpp>
#include <parcp/log.hpp>
#include <parcp/os_filesystem.hpp>
#include <parcp/path.hpp>
#include <parcp/seen_set.hpp>
#include <parcp/transfer.hpp>
#include <parcp/walker.hpp>
#include <parcp/worker_pool.hpp>

#include "internal.hpp"

#include <cstdio>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace parcp {

namespace {

bool exists(Filesystem &fs, const std::string &path) {
    try {
        (void)fs.stat(path);
        return true;
    } catch (const Error &e) {
        // Anything but "not found" may hide an existing entry.
        return !e.is_not_found();
    }
}

std::string resolved(Filesystem &fs, const std::string &path) {
    try {
        return fs.resolve(path);
    } catch (const Error &e) {
        throw StatError(path, e.code());
    }
}

std::string summary(const CopyStats &stats) {
    char buf[160];
    snprintf(buf, sizeof(buf), "copied %llu file%s (%llu bytes) in %.3fs, %llu failed",
             static_cast<unsigned long long>(stats.files_copied()),
             stats.files_copied() == 1 ? "" : "s",
             static_cast<unsigned long long>(stats.bytes_copied()),
             static_cast<double>(stats.elapsed_ns()) / 1e9,
             static_cast<unsigned long long>(stats.files_failed()));
    return buf;
}

} // namespace

Copier::Copier() : Copier(Options()) {}

Copier::Copier(Options opts) : opts_(std::move(opts)), fs_(opts_.filesystem()) {
    if (!fs_) fs_ = OsFilesystem::shared();
}

CopyStats Copier::copy(const std::string &from_arg, const std::string &to_arg) const {
    const detail::Stopwatch timer;
    detail::CopyCounters counters;

    const std::string from = path::clean(from_arg);
    const std::string to = path::clean(to_arg);
    if (from == to) {
        log_emit(LogLevel::Debug, "source and destination are the same, nothing to do: " + from);
        return CopyStats(counters, 0);
    }

    FileInfo from_info;
    try {
        from_info = fs_->stat(from);
    } catch (const Error &e) {
        throw StatError(from, e.code());
    }

    // Different spellings of one location compare equal once resolved.
    const std::string real_from = resolved(*fs_, from);
    const std::string real_to = resolved(*fs_, to);
    if (real_from == real_to) {
        log_emit(LogLevel::Debug, "source and destination are the same, nothing to do: " + from);
        return CopyStats(counters, 0);
    }

    if (!opts_.clobber() && exists(*fs_, to)) {
        throw ClobberAvoidedError(to);
    }

    if (!from_info.is_directory()) {
        counters.bytes_copied = transfer_file(*fs_, from, to, opts_.effective_buffer_size());
        counters.files_copied = 1;
        return CopyStats(counters, timer.elapsed_ns());
    }

    if (path::is_within(real_to, real_from)) {
        throw NestedCopyError(from, to);
    }

    try {
        fs_->mkdir_all(to, from_info.mode & 07777);
    } catch (const Error &e) {
        throw DirectoryCreationError(to, e.code());
    }

    log_emit(LogLevel::Info, "copying " + from + " -> " + to + " with " +
                                 std::to_string(opts_.effective_parallel()) + " workers");

    try {
        copy_tree(from, to, counters);
    } catch (const Failures &) {
        log_emit(LogLevel::Info, summary(CopyStats(counters, timer.elapsed_ns())));
        throw;
    }

    CopyStats stats(counters, timer.elapsed_ns());
    log_emit(LogLevel::Info, summary(stats));
    return stats;
}

void Copier::copy_tree(const std::string &from, const std::string &to,
                       detail::CopyCounters &counters) const {
    // One seen-set per directory copy, never shared between calls.
    SeenSet seen;
    Channel<Job> jobs;
    Channel<std::exception_ptr> failures;

    WorkerPool pool(*fs_, jobs, failures, opts_.effective_parallel(),
                    opts_.effective_buffer_size(), counters);
    TreeWalker walker(*fs_, from, to, seen, jobs, failures, counters);

    pool.start();

    std::thread producer;
    try {
        producer = std::thread([&walker] { walker.run(); });
    } catch (const std::exception &e) {
        log_emit(LogLevel::Error, std::string("cannot start walker: ") + e.what());
        jobs.close();
        pool.join();
        throw;
    }

    // The failure channel closes once every worker has exited, which happens
    // only after the walker has closed the job channel and it is drained.
    std::vector<std::exception_ptr> errors;
    while (auto err = failures.receive()) {
        errors.push_back(std::move(*err));
    }

    producer.join();
    pool.join();

    if (!errors.empty()) {
        throw Failures(std::move(errors));
    }
}

} // namespace parcp
