#include "mcp/mcp-error.hpp"

namespace mcp {

static std::string call_error_what(int code, const std::string & message) {
    return "call failed (" + std::to_string(code) + "): " + message;
}

CallError::CallError(int code, const std::string & message, json data)
    : Error(call_error_what(code, message)), code_(code), message_(message), data_(std::move(data)) {
}

CallError CallError::from_json(const json & error) {
    if (!error.is_object()) {
        return CallError(ERROR_INTERNAL, error.is_string() ? error.get<std::string>() : error.dump());
    }

    int code = ERROR_INTERNAL;
    if (error.contains("code") && error.at("code").is_number_integer()) {
        code = error.at("code").get<int>();
    }

    std::string message;
    if (error.contains("message") && error.at("message").is_string()) {
        message = error.at("message").get<std::string>();
    }

    json data = error.contains("data") ? error.at("data") : json(nullptr);

    return CallError(code, message, std::move(data));
}

json CallError::to_json() const {
    json error = {
        {"code",    code_},
        {"message", message_}
    };
    if (!data_.is_null()) {
        error["data"] = data_;
    }
    return error;
}

} // namespace mcp
