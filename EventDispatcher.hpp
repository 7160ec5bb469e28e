// EventDispatcher.hpp
#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <nlohmann/json.hpp>

// Sink for outbound protocol messages. Returns false once the peer is gone.
class MessageWriter {
public:
    virtual ~MessageWriter() = default;
    virtual bool write_message(const nlohmann::json& message) = 0;
};

// One ordered outbound queue per session. Responses and events take their
// seq from the same counter when they are posted, and leave in that order.
class EventDispatcher {
public:
    explicit EventDispatcher(MessageWriter& writer);

    // Returns the seq assigned to the message.
    int64_t post_response(const nlohmann::json& request, bool success,
                          const nlohmann::json& body = nullptr, const std::string& message = "");
    int64_t post_event(const std::string& event, const nlohmann::json& body = nullptr);

    // Writes everything queued. Returns false if the transport failed; the
    // queue is dropped and every later flush is a no-op.
    bool flush();

    bool closed() const { return transport_closed; }
    size_t pending() const { return queue.size(); }
    int64_t last_seq() const { return next_seq - 1; }

private:
    MessageWriter& writer;
    int64_t next_seq = 1;
    std::deque<nlohmann::json> queue;
    bool transport_closed = false;
};
