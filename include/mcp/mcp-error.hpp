#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace mcp {

using json = nlohmann::ordered_json;

// JSON-RPC 2.0 error codes
enum error_code : int {
    ERROR_PARSE            = -32700,
    ERROR_INVALID_REQUEST  = -32600,
    ERROR_METHOD_NOT_FOUND = -32601,
    ERROR_INVALID_PARAMS   = -32602,
    ERROR_INTERNAL         = -32603,
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string & what) : std::runtime_error(what) {}
};

// the peer executable could not be launched
class SpawnError : public Error {
public:
    explicit SpawnError(const std::string & what) : Error("spawn failed: " + what) {}
};

// a line on the wire could not be turned into a message
class FramingError : public Error {
public:
    explicit FramingError(const std::string & what) : Error(what) {}
};

// a gated operation was attempted before initialize completed
class NotInitializedError : public Error {
public:
    explicit NotInitializedError(const std::string & method)
        : Error("client not initialized: " + method), method_(method) {}

    const std::string & method() const { return method_; }

private:
    std::string method_;
};

// the peer answered with a JSON-RPC error object
class CallError : public Error {
public:
    CallError(int code, const std::string & message, json data = nullptr);

    // builds from a wire error object, tolerating missing fields
    static CallError from_json(const json & error);

    int code() const { return code_; }
    const std::string & message() const { return message_; }
    const json & data() const { return data_; }

    json to_json() const;

private:
    int         code_;
    std::string message_;
    json        data_;
};

// the session ended or the peer went away while a call was outstanding
class TransportClosedError : public Error {
public:
    explicit TransportClosedError(const std::string & what) : Error("transport closed: " + what) {}
};

// operation on a session that is no longer open
class SessionClosedError : public TransportClosedError {
public:
    explicit SessionClosedError(const std::string & what) : TransportClosedError(what) {}
};

// the caller's own cancellation or deadline fired
class CancellationError : public Error {
public:
    explicit CancellationError(const std::string & what) : Error("cancelled: " + what) {}
};

} // namespace mcp
