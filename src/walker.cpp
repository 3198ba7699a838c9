// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file walker.cpp
 * @brief Source tree walker producing transfer jobs
 */

#include <parcp/error.hpp>
#include <parcp/log.hpp>
#include <parcp/path.hpp>
#include <parcp/walker.hpp>

#include <utility>

namespace parcp {

TreeWalker::TreeWalker(Filesystem &fs, std::string from, std::string to, SeenSet &seen,
                       Channel<Job> &jobs, Channel<std::exception_ptr> &failures,
                       detail::CopyCounters &counters)
    : fs_(fs), from_(std::move(from)), to_(std::move(to)), seen_(seen), jobs_(jobs),
      failures_(failures), counters_(counters) {}

void TreeWalker::run() noexcept {
    try {
        fs_.walk(from_, [this](const std::string &path, const FileInfo &info) {
            visit(path, info);
        });
    } catch (const Error &e) {
        log_emit(LogLevel::Error, std::string("walk failed: ") + e.what());
        const std::string &where = e.path().empty() ? from_ : e.path();
        report(std::make_exception_ptr(WalkError(where, e.code())));
    } catch (const std::exception &e) {
        log_emit(LogLevel::Error, std::string("walk failed: ") + e.what());
        report(std::current_exception());
    }
    jobs_.close();
}

void TreeWalker::visit(const std::string &path, const FileInfo &info) {
    if (info.is_directory()) return;

    if (info.type == FileType::Other) {
        counters_.special_skipped++;
        log_emit(LogLevel::Notice, "skipping special file: " + path);
        return;
    }

    std::string dst = path::join(to_, path::relative(from_, path));
    if (!seen_.claim(dst)) {
        counters_.duplicates_skipped++;
        log_emit(LogLevel::Notice, "skipping already claimed destination: " + dst);
        return;
    }

    if (log_enabled()) log_emit(LogLevel::Debug, "queue " + path + " -> " + dst);
    if (!jobs_.send(Job{path, std::move(dst)})) {
        throw Error(ECANCELED, "job queue closed", path);
    }
}

void TreeWalker::report(std::exception_ptr failure) {
    if (!failures_.send(std::move(failure))) {
        log_emit(LogLevel::Warning, "failure channel closed, walk error dropped");
    }
}

} // namespace parcp
