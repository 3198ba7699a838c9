// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file worker_pool.cpp
 * @brief Fixed pool of transfer workers draining a job channel
 */

#include <parcp/log.hpp>
#include <parcp/transfer.hpp>
#include <parcp/worker_pool.hpp>

#include <algorithm>
#include <string>

namespace parcp {

WorkerPool::WorkerPool(Filesystem &fs, Channel<Job> &jobs, Channel<std::exception_ptr> &failures,
                       int workers, size_t buffer_size, detail::CopyCounters &counters)
    : fs_(fs), jobs_(jobs), failures_(failures), workers_(std::max(workers, 1)),
      buffer_size_(buffer_size), counters_(counters) {}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::start() {
    remaining_.store(workers_);
    threads_.reserve(static_cast<size_t>(workers_));
    for (int i = 0; i < workers_; i++) {
        try {
            threads_.emplace_back([this] { run(); });
        } catch (const std::exception &e) {
            log_emit(LogLevel::Error, std::string("cannot start worker: ") + e.what());
            jobs_.close();
            // Workers that never started count as exited.
            for (int j = i; j < workers_; j++) worker_exited();
            throw;
        }
    }
}

void WorkerPool::join() {
    for (auto &t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::run() noexcept {
    while (auto job = jobs_.receive()) {
        try {
            uint64_t n = transfer_file(fs_, job->from, job->to, buffer_size_);
            counters_.files_copied++;
            counters_.bytes_copied += n;
            if (log_enabled()) {
                log_emit(LogLevel::Debug, "copied " + job->from + " -> " + job->to);
            }
        } catch (const std::exception &e) {
            counters_.files_failed++;
            log_emit(LogLevel::Warning, e.what());
            if (!failures_.send(std::current_exception())) {
                log_emit(LogLevel::Warning, "failure channel closed, error dropped");
            }
        }
    }
    worker_exited();
}

void WorkerPool::worker_exited() noexcept {
    if (remaining_.fetch_sub(1) == 1) {
        failures_.close();
    }
}

} // namespace parcp
