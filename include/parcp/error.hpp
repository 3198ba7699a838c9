// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 parcp Contributors


/**
 * @file error.hpp
 * @brief Exception hierarchy for parcp
 *
 * Every failure is a parcp::Error, which is a std::system_error over
 * std::generic_category, so callers can catch either. Filesystem
 * implementations throw plain Error; the copy engine rethrows as one of the
 * typed subclasses below, keeping the underlying errno.
 */

#ifndef PARCP_ERROR_HPP
#define PARCP_ERROR_HPP

#include <cerrno>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace parcp {

/**
 * Base exception for parcp errors
 *
 * Wraps a positive errno value with a context message and, where one
 * applies, the path the operation was working on.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     * @param path Path involved in the failed operation
     */
    explicit Error(int err, std::string_view context = {}, std::string path = {})
        : std::system_error(err, std::generic_category(), std::string(context)),
          path_(std::move(path)) {}

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return std::system_error::code().value(); }

    /**
     * Get the path involved
     * @return Path, or empty when the error is not tied to one
     */
    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    // Convenience predicates
    [[nodiscard]] bool is_not_found() const noexcept { return code() == ENOENT; }
    [[nodiscard]] bool is_exists() const noexcept { return code() == EEXIST; }
    [[nodiscard]] bool is_permission() const noexcept {
        return code() == EACCES || code() == EPERM;
    }
    [[nodiscard]] bool is_invalid() const noexcept { return code() == EINVAL; }

  private:
    std::string path_;
};

/// Source metadata could not be read.
class StatError : public Error {
  public:
    StatError(std::string path, int err)
        : Error(err, "reading file metadata for " + path, path) {}
};

/// Destination exists and clobbering is disabled.
class ClobberAvoidedError : public Error {
  public:
    explicit ClobberAvoidedError(std::string path)
        : Error(EEXIST, "avoided attempt to clobber existing file or directory \"" + path + "\"",
                path) {}
};

/// Source file could not be opened for reading.
class OpenError : public Error {
  public:
    OpenError(std::string path, int err) : Error(err, "opening " + path, path) {}
};

/// Parent directories of a destination could not be created.
class DirectoryCreationError : public Error {
  public:
    DirectoryCreationError(std::string path, int err)
        : Error(err, "preparing directories for " + path, path) {}
};

/// Destination file could not be created or truncated.
class CreateError : public Error {
  public:
    CreateError(std::string path, int err) : Error(err, "creating " + path, path) {}
};

/**
 * Byte transfer failed part way
 *
 * path() is the destination; source() is the file being read.
 */
class CopyError : public Error {
  public:
    CopyError(std::string from, std::string to, int err)
        : Error(err, "copying file from " + from + " to " + to, to), source_(std::move(from)) {}

    [[nodiscard]] const std::string &source() const noexcept { return source_; }

  private:
    std::string source_;
};

/// Source tree traversal failed.
class WalkError : public Error {
  public:
    WalkError(std::string path, int err) : Error(err, "walking file system at " + path, path) {}
};

/// Destination lies inside the source directory.
class NestedCopyError : public Error {
  public:
    NestedCopyError(const std::string &from, std::string to)
        : Error(EINVAL, "cannot copy directory " + from + " into its own subdirectory " + to,
                to) {}
};

/**
 * Aggregate of the per-file failures of one directory copy
 *
 * Failures arrive from worker threads as std::exception_ptr and are kept in
 * arrival order, which is unspecified.
 */
class Failures : public Error {
  public:
    explicit Failures(std::vector<std::exception_ptr> errors)
        : Error(EIO, "copy failures"), errors_(std::move(errors)) {
        message_ = "[";
        for (size_t i = 0; i < errors_.size(); i++) {
            message_ += describe(errors_[i]);
            if (i != errors_.size() - 1) message_ += ",\n";
        }
        message_ += "\n]";
    }

    [[nodiscard]] const char *what() const noexcept override { return message_.c_str(); }

    [[nodiscard]] size_t size() const noexcept { return errors_.size(); }

    [[nodiscard]] const std::vector<std::exception_ptr> &errors() const noexcept {
        return errors_;
    }

    /**
     * Count the collected failures of a given type
     *
     * @tparam E Exception type to match (subclasses match too)
     * @return Number of failures that are an E
     */
    template <typename E> [[nodiscard]] size_t count() const {
        size_t n = 0;
        for (const auto &ep : errors_) {
            try {
                std::rethrow_exception(ep);
            } catch (const E &) {
                n++;
            } catch (const std::exception &) {
            }
        }
        return n;
    }

  private:
    static std::string describe(const std::exception_ptr &ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            return e.what();
        }
    }

    std::vector<std::exception_ptr> errors_;
    std::string message_;
};

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param context Error context message
 * @param path Path involved
 * @throws Error with current errno if condition is false
 */
inline void check(bool condition, std::string_view context = {}, const std::string &path = {}) {
    if (!condition) {
        throw Error(errno, context, path);
    }
}

/**
 * Throw Error from current errno
 *
 * @param context Error context message
 * @param path Path involved
 * @throws Error with current errno
 */
[[noreturn]] inline void throw_errno(std::string_view context = {}, const std::string &path = {}) {
    throw Error(errno, context, path);
}

} // namespace parcp

#endif // PARCP_ERROR_HPP
