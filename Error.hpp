// Error.hpp
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Error {
    // Indexes into the message table in Error.cpp.
    enum Code : uint8_t {
        OK = 0,
        UNKNOWN_COMMAND = 1,
        MISSING_ARGUMENTS = 2,
        INVALID_ARGUMENTS = 3,
        INVALID_STATE = 4,
        SESSION_TERMINATED = 5,
        FILE_NOT_FOUND = 6,
        FILE_IO = 7,
        LAUNCH_FAILED = 8,
        ATTACH_FAILED = 9,
        HANDSHAKE_TIMEOUT = 10,
        NO_DEBUGGEE = 11,
        BRIDGE_WRITE = 12,
        QUERY_TIMEOUT = 13,
        INVALID_EXPRESSION = 14,
        UNSAFE_EXPRESSION = 15,
        INVALID_REFERENCE = 16,
        MALFORMED_MESSAGE = 17
    };

    std::string getMessage(uint8_t errorCode);

    // Thrown by request handlers and bridges. The session turns it into a
    // failed response; it never escapes a session.
    class Failure : public std::runtime_error {
    public:
        Failure(Code code, const std::string& detail = "");

        Code code() const { return error_code; }
        const std::string& detail() const { return error_detail; }

    private:
        Code error_code;
        std::string error_detail;
    };

    // Logs "? Error #n,<message>: <detail>" through TextIO.
    void print(Code code, const std::string& detail = "");
}
