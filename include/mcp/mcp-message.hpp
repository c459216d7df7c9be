#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace mcp {

using json = nlohmann::ordered_json;

enum class message_type {
    request,
    notification,
    response,
};

const char * message_type_name(message_type type);

// One JSON-RPC 2.0 message. Absent optional fields are null.
struct message {
    message_type type = message_type::notification;

    std::string method; // request, notification
    json        params; // request, notification
    json        id;     // request, response
    json        result; // response
    json        error;  // response, error object when the call failed

    bool is_error() const { return type == message_type::response && !error.is_null(); }

    static message request     (const json & id, const std::string & method, const json & params = nullptr);
    static message notification(const std::string & method, const json & params = nullptr);
    static message response    (const json & id, const json & result);
    static message error_response(const json & id, const json & error);
};

bool operator==(const message & a, const message & b);
bool operator!=(const message & a, const message & b);

json message_to_json(const message & msg);

// throws FramingError("invalid message") if the value is not a JSON-RPC 2.0 message
message message_from_json(const json & j);

} // namespace mcp
