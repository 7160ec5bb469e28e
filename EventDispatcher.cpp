// EventDispatcher.cpp
#include "EventDispatcher.hpp"
#include "TextIO.hpp"

EventDispatcher::EventDispatcher(MessageWriter& writer) : writer(writer) {}

int64_t EventDispatcher::post_response(const nlohmann::json& request, bool success,
                                       const nlohmann::json& body, const std::string& message) {
    nlohmann::json response;
    response["seq"] = next_seq++;
    response["type"] = "response";
    response["request_seq"] = request.is_object() && request.contains("seq") && request["seq"].is_number_integer()
        ? request["seq"].get<int64_t>() : 0;
    response["success"] = success;
    response["command"] = request.is_object() && request.contains("command") && request["command"].is_string()
        ? request["command"].get<std::string>() : std::string();
    if (!message.empty()) {
        response["message"] = message;
    }
    if (!body.is_null()) {
        response["body"] = body;
    }
    queue.push_back(std::move(response));
    return queue.back()["seq"].get<int64_t>();
}

int64_t EventDispatcher::post_event(const std::string& event, const nlohmann::json& body) {
    nlohmann::json message;
    message["seq"] = next_seq++;
    message["type"] = "event";
    message["event"] = event;
    if (!body.is_null()) {
        message["body"] = body;
    }
    queue.push_back(std::move(message));
    return queue.back()["seq"].get<int64_t>();
}

bool EventDispatcher::flush() {
    if (transport_closed) {
        queue.clear();
        return false;
    }
    while (!queue.empty()) {
        if (!writer.write_message(queue.front())) {
            TextIO::print("? DAP Error: Client write failed, dropping " + std::to_string(queue.size()) + " message(s).\n");
            transport_closed = true;
            queue.clear();
            return false;
        }
        queue.pop_front();
    }
    return true;
}
