// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file syslog.hpp
 * @brief Syslog log handler integration for parcp
 *
 * Forwards parcp log messages to syslog(3). LogLevel values map directly to
 * syslog priorities:
 *   LogLevel::Error   (3) -> LOG_ERR     (3)
 *   LogLevel::Warning (4) -> LOG_WARNING (4)
 *   LogLevel::Notice  (5) -> LOG_NOTICE  (5)
 *   LogLevel::Info    (6) -> LOG_INFO    (6)
 *   LogLevel::Debug   (7) -> LOG_DEBUG   (7)
 *
 * Usage:
 * @code
 *   parcp::install_syslog();      // defaults: ident="parcp", LOG_USER
 *   parcp::Copier().copy(from, to);
 *   parcp::remove_syslog();
 * @endcode
 */

#ifndef PARCP_SYSLOG_HPP
#define PARCP_SYSLOG_HPP

#include <string>

namespace parcp {

/**
 * Syslog configuration options
 *
 * A value of -1 means "use default" for numeric fields.
 */
struct SyslogOptions {
    std::string ident = "parcp"; ///< openlog ident, copied and retained until remove_syslog()
    int facility = -1;           ///< Syslog facility (default: LOG_USER)
    int log_options = -1;        ///< openlog() option flags (default: LOG_PID | LOG_NDELAY)
};

/**
 * Install a syslog-forwarding log handler.
 *
 * Calls openlog() then replaces the process-wide log handler with one that
 * calls syslog().
 *
 * @param options Configuration
 */
void install_syslog(const SyslogOptions &options = {});

/**
 * Remove the syslog log handler and close syslog.
 *
 * Restores the default (no handler) state and calls closelog().
 */
void remove_syslog();

} // namespace parcp

#endif // PARCP_SYSLOG_HPP
