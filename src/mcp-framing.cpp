#include "mcp/mcp-framing.hpp"
#include "mcp/mcp-error.hpp"
#include "mcp/mcp-log.hpp"

namespace mcp {

static const size_t READ_CHUNK_SIZE = 4096;

static std::string trim(const std::string & s) {
    const char * ws = " \t\r\n";
    const size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return std::string();
    }
    const size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

Framer::Framer(Transport & transport, bool log_frames)
    : transport_(transport), log_frames_(log_frames) {
}

message Framer::read(const CancelToken & cancel) {
    if (cancel.cancelled()) {
        throw CancellationError(cancel.reason());
    }

    size_t pos;
    while ((pos = buffer_.find('\n')) == std::string::npos) {
        char chunk[READ_CHUNK_SIZE];
        const size_t n = transport_.read(chunk, sizeof(chunk));
        if (n == 0) {
            if (cancel.cancelled()) {
                throw CancellationError(cancel.reason());
            }
            if (log_frames_) {
                MCP_LOG_DEBUG("%s: end of stream, %zu bytes unterminated\n", __func__, buffer_.size());
            }
            throw TransportClosedError("end of stream");
        }
        buffer_.append(chunk, n);
    }

    const std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (log_frames_) {
        MCP_LOG_DEBUG("%s: read %zu bytes: %s\n", __func__, line.size(), line.c_str());
    }

    return decode(line);
}

void Framer::write(const message & msg, int timeout_ms) {
    const std::string data = encode(msg);

    if (log_frames_) {
        MCP_LOG_DEBUG("%s: writing %zu bytes: %.*s\n", __func__, data.size(), (int) data.size() - 1, data.c_str());
    }

    transport_.write(data.data(), data.size(), timeout_ms);
}

std::string Framer::encode(const message & msg) {
    // dump() escapes control characters, the only raw '\n' is the terminator
    std::string data = message_to_json(msg).dump(-1, ' ', false, json::error_handler_t::replace);
    data += '\n';
    return data;
}

message Framer::decode(const std::string & line) {
    const std::string text = trim(line);
    if (text.empty()) {
        throw FramingError("empty message");
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error & e) {
        MCP_LOG_DEBUG("%s: JSON parse error: %s\n", __func__, e.what());
        throw FramingError("malformed json");
    }

    return message_from_json(j);
}

} // namespace mcp
