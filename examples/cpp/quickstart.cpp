/**
 * @file quickstart.cpp
 * @brief Minimal working example of a parcp directory copy
 *
 * Run:   ./examples/cpp/quickstart
 */

#include <parcp.hpp>

#include <fstream>
#include <iostream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

int main() {
    const std::string src = "/tmp/parcp_quickstart_src";
    const std::string dst = "/tmp/parcp_quickstart_dst";
    const char *test_data = "Hello from parcp! Copied by a pool of workers.\n";

    try {
        // Create a small source tree
        mkdir(src.c_str(), 0755);
        mkdir((src + "/nested").c_str(), 0755);
        for (const char *name : {"/one.txt", "/two.txt", "/nested/three.txt"}) {
            std::ofstream out(src + name, std::ios::binary);
            if (!out) {
                std::cerr << "Failed to create test file\n";
                return 1;
            }
            out << test_data;
        }

        // Overwrite whatever an earlier run left behind, 4 transfers at a time
        parcp::Copier copier(parcp::Options().clobber(true).parallel(4));
        auto stats = copier.copy(src, dst);

        std::cout << "Copied " << stats.files_copied() << " files (" << stats.bytes_copied()
                  << " bytes) from " << src << " to " << dst << "\n";

        std::ifstream in(dst + "/nested/three.txt");
        std::string line;
        std::getline(in, line);
        std::cout << "Content: " << line << "\n";

        // Cleanup
        for (const char *name : {"/one.txt", "/two.txt", "/nested/three.txt"}) {
            unlink((src + name).c_str());
            unlink((dst + name).c_str());
        }
        rmdir((src + "/nested").c_str());
        rmdir((dst + "/nested").c_str());
        rmdir(src.c_str());
        rmdir(dst.c_str());

    } catch (const parcp::Failures &f) {
        std::cerr << f.size() << " files failed:\n" << f.what() << "\n";
        return 1;
    } catch (const parcp::Error &e) {
        std::cerr << "parcp error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
