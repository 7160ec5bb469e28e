// TextIO.hpp
#pragma once
#include <string>

// The adapter's diagnostic log. Standard output may carry the protocol,
// so everything here goes to stderr or to the file named by --log.
namespace TextIO {
    void print(const std::string& message);
    void debug(const std::string& message); // Only written in verbose mode
    void nl(); // Newline

    void set_verbose(bool on);

    // Redirects the log to a file (appending). Returns false if it can't be opened.
    bool set_log_file(const std::string& path);
}
