// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file log.hpp
 * @brief Logging interface for parcp
 *
 * One handler per process receives every message the copy engine emits,
 * from whichever walker or worker thread emitted it. Without a handler the
 * library prints nothing.
 *
 * What gets logged:
 * - Debug: each queued job and each finished transfer
 * - Notice: skipped special files and already claimed destinations
 * - Warning: each failed transfer
 * - Error: a failed tree walk
 * - Info: start and summary of a directory copy
 *
 * Example:
 * @code
 *   parcp::set_log_handler([](parcp::LogLevel level, std::string_view msg) {
 *       if (level <= parcp::LogLevel::Warning) std::cerr << msg << "\n";
 *   });
 *   parcp::Copier().copy("/data/in", "/data/out");
 *   parcp::clear_log_handler();
 * @endcode
 */

#ifndef PARCP_LOG_HPP
#define PARCP_LOG_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

namespace parcp {

/// Message severity, numerically equal to the syslog priority
enum class LogLevel {
    Error = 3,
    Warning = 4,
    Notice = 5,
    Info = 6,
    Debug = 7
};

/// Short tag for a level: "ERR", "WARN", "NOTICE", "INFO" or "DEBUG"
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    }
    return "???";
}

using LogHandler = std::function<void(LogLevel, std::string_view)>;

namespace detail {

struct LogState {
    std::mutex mutex;
    LogHandler handler;
    std::atomic<bool> installed{false};
};

inline LogState &log_state() {
    static LogState state;
    return state;
}

} // namespace detail

/**
 * Install the process-wide handler, replacing any previous one
 *
 * Calls are serialized: the handler never runs on two threads at once.
 */
inline void set_log_handler(LogHandler handler) {
    auto &st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.handler = std::move(handler);
    st.installed = static_cast<bool>(st.handler);
}

/// Drop the handler; the library goes silent again.
inline void clear_log_handler() noexcept {
    auto &st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    st.handler = nullptr;
    st.installed = false;
}

/// True while a handler is installed. Lets callers skip formatting.
[[nodiscard]] inline bool log_enabled() noexcept {
    return detail::log_state().installed.load(std::memory_order_relaxed);
}

/// Pass a message to the handler, if there is one.
inline void log_emit(LogLevel level, std::string_view msg) {
    auto &st = detail::log_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.handler) st.handler(level, msg);
}

} // namespace parcp

#endif // PARCP_LOG_HPP
