// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file syslog.cpp
 * @brief Syslog forwarding for the parcp log handler
 */

#include <parcp/log.hpp>
#include <parcp/syslog.hpp>

#include <mutex>
#include <string>

#include <syslog.h>

namespace parcp {

namespace {

// openlog() retains the ident pointer, so the string lives here.
std::mutex g_ident_mutex;
std::string g_ident;

} // namespace

void install_syslog(const SyslogOptions &options) {
    int facility = options.facility >= 0 ? options.facility : LOG_USER;
    int log_options = options.log_options >= 0 ? options.log_options : (LOG_PID | LOG_NDELAY);

    {
        std::lock_guard<std::mutex> lock(g_ident_mutex);
        g_ident = options.ident.empty() ? std::string("parcp") : options.ident;
        openlog(g_ident.c_str(), log_options, facility);
    }

    set_log_handler([](LogLevel level, std::string_view msg) {
        syslog(static_cast<int>(level), "%.*s", static_cast<int>(msg.size()), msg.data());
    });
}

void remove_syslog() {
    clear_log_handler();
    std::lock_guard<std::mutex> lock(g_ident_mutex);
    closelog();
}

} // namespace parcp
