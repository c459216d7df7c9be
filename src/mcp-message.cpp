#include "mcp/mcp-message.hpp"
#include "mcp/mcp-error.hpp"

namespace mcp {

static const char * JSONRPC_VERSION = "2.0";

const char * message_type_name(message_type type) {
    switch (type) {
        case message_type::request:      return "request";
        case message_type::notification: return "notification";
        case message_type::response:     return "response";
    }
    return "unknown";
}

message message::request(const json & id, const std::string & method, const json & params) {
    message msg;
    msg.type   = message_type::request;
    msg.id     = id;
    msg.method = method;
    msg.params = params;
    return msg;
}

message message::notification(const std::string & method, const json & params) {
    message msg;
    msg.type   = message_type::notification;
    msg.method = method;
    msg.params = params;
    return msg;
}

message message::response(const json & id, const json & result) {
    message msg;
    msg.type   = message_type::response;
    msg.id     = id;
    msg.result = result;
    return msg;
}

message message::error_response(const json & id, const json & error) {
    message msg;
    msg.type  = message_type::response;
    msg.id    = id;
    msg.error = error;
    return msg;
}

bool operator==(const message & a, const message & b) {
    return a.type   == b.type   &&
           a.method == b.method &&
           a.params == b.params &&
           a.id     == b.id     &&
           a.result == b.result &&
           a.error  == b.error;
}

bool operator!=(const message & a, const message & b) {
    return !(a == b);
}

json message_to_json(const message & msg) {
    json j = {
        {"jsonrpc", JSONRPC_VERSION}
    };

    switch (msg.type) {
        case message_type::request:
            j["id"]     = msg.id;
            j["method"] = msg.method;
            if (!msg.params.is_null()) {
                j["params"] = msg.params;
            }
            break;
        case message_type::notification:
            j["method"] = msg.method;
            if (!msg.params.is_null()) {
                j["params"] = msg.params;
            }
            break;
        case message_type::response:
            j["id"] = msg.id;
            if (!msg.error.is_null()) {
                j["error"] = msg.error;
            } else {
                // a successful response always carries a result, even an empty one
                j["result"] = msg.result;
            }
            break;
    }

    return j;
}

static bool is_valid_id(const json & id) {
    return id.is_number_integer() || id.is_string();
}

message message_from_json(const json & j) {
    if (!j.is_object()) {
        throw FramingError("invalid message");
    }
    if (!j.contains("jsonrpc") || j.at("jsonrpc") != JSONRPC_VERSION) {
        throw FramingError("invalid message");
    }

    message msg;

    if (j.contains("method")) {
        if (!j.at("method").is_string()) {
            throw FramingError("invalid message");
        }
        msg.method = j.at("method").get<std::string>();
        msg.params = j.value("params", json(nullptr));

        if (j.contains("id") && !j.at("id").is_null()) {
            if (!is_valid_id(j.at("id"))) {
                throw FramingError("invalid message");
            }
            msg.type = message_type::request;
            msg.id   = j.at("id");
        } else {
            msg.type = message_type::notification;
        }
        return msg;
    }

    if (j.contains("id") && (j.contains("result") || j.contains("error"))) {
        msg.type   = message_type::response;
        msg.id     = j.at("id");
        msg.result = j.value("result", json(nullptr));
        msg.error  = j.value("error",  json(nullptr));
        return msg;
    }

    throw FramingError("invalid message");
}

} // namespace mcp
