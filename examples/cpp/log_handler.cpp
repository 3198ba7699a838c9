/**
 * @file log_handler.cpp
 * @brief Demonstrate parcp custom log handler
 *
 * Shows how to install a custom log callback that formats library
 * messages with timestamps and severity levels, and how to emit
 * application-level messages through the same pipeline using
 * parcp::log_emit(). The copy runs against an in-memory filesystem
 * with one unreadable file, so the warning path is visible too.
 *
 * Run:   ./examples/cpp/log_handler
 */

#include <parcp.hpp>

#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

int main() {
    std::cout << "parcp Log Handler Example\n";
    std::cout << "=========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    parcp::set_log_handler([](parcp::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << parcp::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    parcp::log_emit(parcp::LogLevel::Info, "log handler installed, building source tree");

    // --- Step 3: Prepare an in-memory tree with one bad file -------------
    auto fs = std::make_shared<parcp::MemFilesystem>();
    fs->write_file("/data/report.csv", "a,b,c\n1,2,3\n");
    fs->write_file("/data/img/logo.png", std::string(2048, '\x7f'));
    fs->write_file("/data/secret.key", "hunter2", 0600);
    fs->inject_fault(parcp::MemOp::Open, "/data/secret.key", EACCES);

    int status = 0;
    try {
        // --- Step 4: Copy ------------------------------------------------
        parcp::Copier copier(parcp::Options().filesystem(fs).parallel(2));
        copier.copy("/data", "/backup");
    } catch (const parcp::Failures &f) {
        // Each failure was already logged as a warning by the worker that hit it
        parcp::log_emit(parcp::LogLevel::Notice,
                        std::to_string(f.size()) + " file(s) could not be copied");
        status = f.count<parcp::OpenError>() == f.size() ? 0 : 1;
    } catch (const parcp::Error &e) {
        parcp::log_emit(parcp::LogLevel::Error, std::string("parcp error: ") + e.what());
        status = 1;
    }

    // --- Step 5: Clean up ------------------------------------------------
    parcp::clear_log_handler();

    std::cout << "\n--- Summary ---\n";
    std::cout << "Backup holds report.csv: " << (fs->exists("/backup/report.csv") ? "yes" : "no")
              << "\n";
    std::cout << "The log handler captured all library and application messages\n";
    std::cout << "on stderr with timestamps, severity levels, and an app prefix.\n";
    std::cout << "For system logging, call parcp::install_syslog() instead.\n";

    return status;
}
