#pragma once

#include "mcp-cancel.hpp"
#include "mcp-message.hpp"
#include "mcp-transport.hpp"

#include <string>

namespace mcp {

// Newline-delimited JSON framing: one compact JSON message per line, terminated by a single '\n'.
//
// read() must only be called from one thread. write() performs a single transport write per
// message, callers that share a Framer between threads must serialize their writes.
class Framer {
public:
    explicit Framer(Transport & transport, bool log_frames = false);

    // throws CancellationError if cancel is triggered, FramingError for a bad line and
    // TransportClosedError at end of stream
    message read(const CancelToken & cancel = CancelToken());

    // timeout_ms bounds the transport write, -1 - no limit
    void write(const message & msg, int timeout_ms = -1);

    // the wire form of msg, including the trailing '\n'
    static std::string encode(const message & msg);

    // parse one line, without its terminator
    static message decode(const std::string & line);

private:
    Transport & transport_;
    bool        log_frames_;
    std::string buffer_;
};

} // namespace mcp
