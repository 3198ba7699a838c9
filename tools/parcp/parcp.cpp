/**
 * @file parcp.cpp
 * @brief parcp - recursive copy with parallel file transfers
 *
 * Copies a file or directory tree like `cp -r`, walking the source on one
 * thread while a pool of workers copies file contents. Existing destination
 * files are overwritten unless --no-clobber is given.
 *
 * Usage: parcp [OPTIONS] SOURCE DEST
 */

#include <parcp.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include <getopt.h>
#include <sys/types.h>
#include <unistd.h>

// ============================================================================
// Constants
// ============================================================================

static constexpr int MAX_PARALLEL = 1024;

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    const char *source = nullptr;
    const char *dest = nullptr;
    int parallel = 0;
    size_t buffer_size = 0;
    bool clobber = true;
    bool quiet = false;
    bool verbose = false;
    bool syslog = false;
};

// ============================================================================
// Size parsing
// ============================================================================

static ssize_t parse_size(const char *str) {
    char *endp;
    double val = strtod(str, &endp);
    if (endp == str || val < 0) return -1;

    switch (*endp) {
    case 'G':
    case 'g':
        val *= 1024.0 * 1024.0 * 1024.0;
        break;
    case 'M':
    case 'm':
        val *= 1024.0 * 1024.0;
        break;
    case 'K':
    case 'k':
        val *= 1024.0;
        break;
    case '\0':
        break;
    default:
        return -1;
    }

    if (val > static_cast<double>(SSIZE_MAX)) return -1;
    return static_cast<ssize_t>(val);
}

// ============================================================================
// Formatting helpers
// ============================================================================

static void format_bytes(char *buf, size_t bufsz, double bytes) {
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, bufsz, "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, bufsz, "%.0f B", bytes);
}

static void format_rate(char *buf, size_t bufsz, double bps) {
    if (bps >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB/s", bps / (1024.0 * 1024.0 * 1024.0));
    else if (bps >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB/s", bps / (1024.0 * 1024.0));
    else if (bps >= 1024.0) snprintf(buf, bufsz, "%.1f KiB/s", bps / 1024.0);
    else snprintf(buf, bufsz, "%.0f B/s", bps);
}

// ============================================================================
// Console notices
// ============================================================================

// Blue "oops:" for usage problems, red "error:" for failed copies.
static void notice(const char *color, const char *tag, const std::string &msg) {
    if (isatty(STDERR_FILENO)) {
        fprintf(stderr, "parcp: %s%s\033[0m %s\n", color, tag, msg.c_str());
    } else {
        fprintf(stderr, "parcp: %s %s\n", tag, msg.c_str());
    }
}

static void oops(const std::string &msg) {
    notice("\033[34m", "oops:", msg);
}

static void fatal(const std::string &msg) {
    notice("\033[31m", "error:", msg);
}

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS] SOURCE DEST\n"
            "\n"
            "Recursive copy with parallel file transfers.\n"
            "\n"
            "Options:\n"
            "  -j, --parallel N     Concurrent file transfers (default: %d, max: %d)\n"
            "  -b, --buffer-size N  Per-transfer chunk size (default: 256K). Suffixes: K, M, G\n"
            "  -n, --no-clobber     Fail if DEST already exists\n"
            "  -q, --quiet          Suppress all output\n"
            "  -v, --verbose        Log each file and print a summary\n"
            "  --syslog             Send log messages to syslog\n"
            "  -h, --help           Show this help\n",
            argv0, parcp::kDefaultParallel, MAX_PARALLEL);
}

// 0 to run the copy, 1 for a usage notice (exit 0), -1 for bad usage (exit 1)
static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"parallel", required_argument, nullptr, 'j'},
                                        {"buffer-size", required_argument, nullptr, 'b'},
                                        {"no-clobber", no_argument, nullptr, 'n'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"syslog", no_argument, nullptr, 'S'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "j:b:nqvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'j': {
            char *end;
            long val = strtol(optarg, &end, 10);
            if (*end != '\0' || val < 1 || val > MAX_PARALLEL) {
                oops("parallel must be 1-" + std::to_string(MAX_PARALLEL));
                return -1;
            }
            config.parallel = static_cast<int>(val);
        } break;
        case 'b': {
            ssize_t sz = parse_size(optarg);
            if (sz <= 0) {
                oops(std::string("invalid buffer size: ") + optarg);
                return -1;
            }
            config.buffer_size = static_cast<size_t>(sz);
        } break;
        case 'n':
            config.clobber = false;
            break;
        case 'q':
            config.quiet = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'S':
            config.syslog = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    // Missing operands only earn a notice: nothing was asked of us.
    if (argc - optind < 2) {
        oops("not enough arguments");
        print_usage(argv[0]);
        return 1;
    }
    if (argc - optind > 2) {
        oops("expected exactly one SOURCE and one DEST");
        print_usage(argv[0]);
        return -1;
    }

    config.source = argv[optind];
    config.dest = argv[optind + 1];
    return 0;
}

static void install_logging(const Config &config) {
    if (config.syslog) {
        parcp::install_syslog();
        return;
    }
    if (config.quiet) return;

    const bool verbose = config.verbose;
    parcp::set_log_handler([verbose](parcp::LogLevel level, std::string_view msg) {
        if (!verbose && level > parcp::LogLevel::Warning) return;
        fprintf(stderr, "parcp: [%s] %.*s\n", parcp::log_level_name(level),
                static_cast<int>(msg.size()), msg.data());
    });
}

static void print_summary(const parcp::CopyStats &stats) {
    double elapsed = static_cast<double>(stats.elapsed_ns()) / 1e9;
    char size_str[32], rate_str[32];
    format_bytes(size_str, sizeof(size_str), static_cast<double>(stats.bytes_copied()));
    format_rate(rate_str, sizeof(rate_str),
                elapsed > 0 ? static_cast<double>(stats.bytes_copied()) / elapsed : 0);

    fprintf(stderr, "Copied %llu file%s (%s) in %.2fs\n",
            static_cast<unsigned long long>(stats.files_copied()),
            stats.files_copied() == 1 ? "" : "s", size_str, elapsed);
    fprintf(stderr, "Throughput: %s\n", rate_str);
    if (stats.special_skipped() > 0) {
        fprintf(stderr, "Skipped %llu special file%s\n",
                static_cast<unsigned long long>(stats.special_skipped()),
                stats.special_skipped() == 1 ? "" : "s");
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    int parsed = parse_args(argc, argv, config);
    if (parsed > 0) return 0;
    if (parsed < 0) return 1;

    install_logging(config);

    int status = 0;
    try {
        parcp::Options opts;
        opts.clobber(config.clobber).parallel(config.parallel).buffer_size(config.buffer_size);

        parcp::Copier copier(opts);
        auto stats = copier.copy(config.source, config.dest);

        if (config.verbose && !config.quiet) print_summary(stats);
    } catch (const parcp::Failures &f) {
        if (!config.quiet) {
            fatal("copying files: " + std::to_string(f.size()) + " failed\n" + f.what());
        }
        status = 1;
    } catch (const parcp::Error &e) {
        if (!config.quiet) fatal(std::string("copying files: ") + e.what());
        status = 1;
    } catch (const std::exception &e) {
        if (!config.quiet) fatal(e.what());
        status = 1;
    }

    if (config.syslog) parcp::remove_syslog();
    else parcp::clear_log_handler();
    return status;
}
