// Transport.cpp
#include "Transport.hpp"
#include "StringUtils.hpp"
#include "TextIO.hpp"
#include <cerrno>
#include <sstream>
#include <unistd.h>

void FrameDecoder::append(const char* data, size_t size) {
    buffer.append(data, size);
}

std::optional<std::string> FrameDecoder::next_body() {
    while (true) {
        size_t header_end = buffer.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return std::nullopt; // Incomplete header
        }

        std::string headers_str = buffer.substr(0, header_end);
        std::istringstream header_stream(headers_str);
        std::string header_line;
        long content_length = -1;

        while (std::getline(header_stream, header_line)) {
            if (!header_line.empty() && header_line.back() == '\r') {
                header_line.pop_back();
            }
            if (StringUtils::starts_with_ci(header_line, "content-length:")) {
                try {
                    size_t used = 0;
                    std::string value = header_line.substr(15);
                    StringUtils::strip(value);
                    content_length = std::stol(value, &used);
                    if (used != value.size() || content_length < 0) {
                        content_length = -1;
                    }
                }
                catch (const std::exception&) {
                    content_length = -1;
                }
            }
        }

        if (content_length == -1) {
            TextIO::print("? DAP Warning: Could not find a valid Content-Length, skipping header block.\n");
            TextIO::debug("Headers received:\n" + headers_str + "\n");
            buffer.erase(0, header_end + 4);
            continue;
        }

        size_t message_start = header_end + 4;
        if (buffer.size() < message_start + static_cast<size_t>(content_length)) {
            return std::nullopt; // Incomplete message body
        }

        std::string body = buffer.substr(message_start, content_length);
        buffer.erase(0, message_start + content_length);
        return body;
    }
}

std::string frame_message(const std::string& body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

MessageReader::MessageReader(int fd) : fd(fd) {}

std::optional<nlohmann::json> MessageReader::next() {
    while (true) {
        while (auto body = decoder.next_body()) {
            try {
                nlohmann::json message = nlohmann::json::parse(*body);
                TextIO::debug("DAP RX: " + *body + "\n");
                return message;
            }
            catch (const nlohmann::json::parse_error& e) {
                TextIO::print("? DAP Error: JSON parse error: " + std::string(e.what()) + "\n");
            }
        }

        char read_buffer[4096];
        ssize_t bytes_read = ::read(fd, read_buffer, sizeof(read_buffer));
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            // Client closed connection or error
            return std::nullopt;
        }
        decoder.append(read_buffer, static_cast<size_t>(bytes_read));
    }
}

FdMessageWriter::FdMessageWriter(int fd) : fd(fd) {}

bool FdMessageWriter::write_message(const nlohmann::json& message) {
    std::string body = message.dump();
    std::string payload = frame_message(body);
    TextIO::debug("DAP TX: " + body + "\n");

    std::lock_guard<std::mutex> lock(write_mutex);
    size_t written = 0;
    while (written < payload.size()) {
        ssize_t n = ::write(fd, payload.data() + written, payload.size() - written);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}
