/**
 * @file parcp.hpp
 * @brief Main header for parcp
 *
 * This is the single header you need to include to use parcp from C++.
 * It provides a recursive copy that walks the source tree on one thread and
 * transfers file contents on a pool of worker threads.
 *
 * Example:
 * @code
 * #include <parcp.hpp>
 *
 * int main() {
 *     parcp::Copier copier(parcp::Options().clobber(true));
 *     try {
 *         copier.copy("/srv/data", "/mnt/backup/data");
 *     } catch (const parcp::Failures &f) {
 *         std::cerr << f.size() << " files failed\n" << f.what() << "\n";
 *         return 1;
 *     } catch (const parcp::Error &e) {
 *         std::cerr << e.what() << "\n";
 *         return 1;
 *     }
 * }
 * @endcode
 *
 * Example (in-memory filesystem):
 * @code
 * auto fs = std::make_shared<parcp::MemFilesystem>();
 * fs->write_file("/a/x.txt", "hello");
 * parcp::Copier(parcp::Options().filesystem(fs)).copy("/a", "/b");
 * // fs->read_file("/b/x.txt") == "hello"
 * @endcode
 */

#ifndef PARCP_HPP
#define PARCP_HPP

// Order matters for dependencies
#include <parcp/fwd.hpp>
#include <parcp/error.hpp>
#include <parcp/log.hpp>
#include <parcp/syslog.hpp>
#include <parcp/path.hpp>
#include <parcp/filesystem.hpp>
#include <parcp/os_filesystem.hpp>
#include <parcp/mem_filesystem.hpp>
#include <parcp/options.hpp>
#include <parcp/stats.hpp>
#include <parcp/channel.hpp>
#include <parcp/seen_set.hpp>
#include <parcp/transfer.hpp>
#include <parcp/walker.hpp>
#include <parcp/worker_pool.hpp>
#include <parcp/copier.hpp>

#endif // PARCP_HPP
