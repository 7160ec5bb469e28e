// Error.cpp
#include "Error.hpp"
#include "TextIO.hpp" // We need this to print the error messages.
#include <vector>

namespace {
    // A table of error messages, indexed by Error::Code.
    const std::vector<std::string> errorMessages = {
            "OK",                               // 0
            "Unknown command",                  // 1
            "Missing arguments",                // 2
            "Invalid arguments",                // 3
            "Request not valid in this state",  // 4
            "Session terminated",               // 5
            "File not found",                   // 6
            "File I/O Error",                   // 7
            "Failed to launch debugger",        // 8
            "Failed to attach to debugger",     // 9
            "Debugger handshake timed out",     // 10
            "No debugger session",              // 11
            "Failed to write to debugger",      // 12
            "Debugger did not respond",         // 13
            "Invalid expression",               // 14
            "Unsafe expression",                // 15
            "Invalid reference",                // 16
            "Malformed message"                 // 17
    };

    std::string compose(Error::Code code, const std::string& detail) {
        std::string text = Error::getMessage(code);
        if (!detail.empty()) {
            text += ": " + detail;
        }
        return text;
    }
}

std::string Error::getMessage(uint8_t errorCode) {
    if (errorCode < errorMessages.size()) {
        return errorMessages[errorCode];
    }
    return "Unknown Error";
}

Error::Failure::Failure(Code code, const std::string& detail)
    : std::runtime_error(compose(code, detail)), error_code(code), error_detail(detail) {
}

void Error::print(Code code, const std::string& detail) {
    if (code == OK) {
        return;
    }
    TextIO::print("? Error #" + std::to_string(code) + "," + compose(code, detail));
    TextIO::nl();
}
