// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file worker_pool.hpp
 * @brief Fixed pool of transfer workers draining a job channel
 */

#ifndef PARCP_WORKER_POOL_HPP
#define PARCP_WORKER_POOL_HPP

#include <parcp/channel.hpp>
#include <parcp/filesystem.hpp>
#include <parcp/stats.hpp>
#include <parcp/walker.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace parcp {

/**
 * Worker threads that transfer files until the job channel is drained
 *
 * A failed transfer does not stop a worker: the exception is sent to the
 * failure channel and the worker takes the next job. When the last worker
 * exits it closes the failure channel, which is how the collector learns the
 * run is over.
 *
 * Example:
 * @code
 * parcp::Channel<parcp::Job> jobs;
 * parcp::Channel<std::exception_ptr> failures;
 * parcp::WorkerPool pool(fs, jobs, failures, 4, kDefaultBufferSize, counters);
 * pool.start();
 * // ... producer sends jobs, then closes `jobs` ...
 * while (auto err = failures.receive()) { ... }
 * pool.join();
 * @endcode
 */
class WorkerPool {
  public:
    /**
     * @param fs Filesystem shared by all workers
     * @param jobs Job channel to drain
     * @param failures Failure channel (closed when the last worker exits)
     * @param workers Worker count (values below 1 are raised to 1)
     * @param buffer_size Transfer chunk size
     * @param counters Run counters
     */
    WorkerPool(Filesystem &fs, Channel<Job> &jobs, Channel<std::exception_ptr> &failures,
               int workers, size_t buffer_size, detail::CopyCounters &counters);

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /// Joins any running workers.
    ~WorkerPool();

    /**
     * Spawn the workers
     *
     * If a thread cannot be spawned, the job channel is closed so the
     * workers already running exit, and the error is rethrown.
     *
     * @throws std::system_error from std::thread
     */
    void start();

    /// Wait for every worker to exit.
    void join();

    [[nodiscard]] int workers() const noexcept { return workers_; }

  private:
    void run() noexcept;
    void worker_exited() noexcept;

    Filesystem &fs_;
    Channel<Job> &jobs_;
    Channel<std::exception_ptr> &failures_;
    const int workers_;
    const size_t buffer_size_;
    detail::CopyCounters &counters_;
    std::atomic<int> remaining_{0};
    std::vector<std::thread> threads_;
};

} // namespace parcp

#endif // PARCP_WORKER_POOL_HPP
