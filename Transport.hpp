// Transport.hpp
#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "EventDispatcher.hpp"

// Splits a byte stream into "Content-Length: N\r\n\r\n<body>" frames.
class FrameDecoder {
public:
    void append(const char* data, size_t size);

    // Next complete body, or nullopt if more bytes are needed. A header block
    // without a usable Content-Length is logged and skipped.
    std::optional<std::string> next_body();

    size_t buffered() const { return buffer.size(); }

private:
    std::string buffer;
};

// Prefixes a serialized message with its Content-Length header.
std::string frame_message(const std::string& body);

// Blocking reader of protocol messages on a file descriptor (stdin or a socket).
class MessageReader {
public:
    explicit MessageReader(int fd);

    // The next message that parsed as JSON. Bodies that are not JSON are
    // logged and dropped. nullopt once the stream ends or fails.
    std::optional<nlohmann::json> next();

private:
    int fd;
    FrameDecoder decoder;
};

class FdMessageWriter : public MessageWriter {
public:
    explicit FdMessageWriter(int fd);

    bool write_message(const nlohmann::json& message) override;

private:
    int fd;
    std::mutex write_mutex;
};
