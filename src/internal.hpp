/**
 * @file internal.hpp
 * @brief Shared internal utilities
 *
 * Internal header - not part of public API.
 */

#ifndef PARCP_INTERNAL_HPP
#define PARCP_INTERNAL_HPP

#include <cstdint>
#include <time.h>

namespace parcp::detail {

/**
 * Monotonic time in nanoseconds (CLOCK_MONOTONIC)
 *
 * @return Current time, or 0 if the clock cannot be read
 */
inline int64_t monotonic_ns() noexcept {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) return 0;
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

/// Measures the wall-clock duration of one copy run.
class Stopwatch {
  public:
    Stopwatch() noexcept : start_ns_(monotonic_ns()) {}

    [[nodiscard]] int64_t elapsed_ns() const noexcept { return monotonic_ns() - start_ns_; }

  private:
    int64_t start_ns_;
};

} // namespace parcp::detail

#endif // PARCP_INTERNAL_HPP
