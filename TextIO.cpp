// TextIO.cpp
#include "TextIO.hpp"
#include <iostream>
#include <fstream>
#include <mutex>
#include <atomic>

namespace {
    // Session loops and bridge readers log from different threads.
    std::mutex log_mutex;
    std::ofstream log_file;
    std::atomic<bool> verbose{ false };

    void write(const std::string& message) {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (log_file.is_open()) {
            log_file << message;
            log_file.flush();
        }
        else {
            std::cerr << message;
        }
    }
}

void TextIO::print(const std::string& message) {
    write(message);
}

void TextIO::debug(const std::string& message) {
    if (verbose.load()) {
        write(message);
    }
}

void TextIO::nl() {
    write("\n");
}

void TextIO::set_verbose(bool on) {
    verbose.store(on);
}

bool TextIO::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(path, std::ios::app);
    return log_file.is_open();
}
