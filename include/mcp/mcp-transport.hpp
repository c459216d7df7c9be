#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace mcp {

struct exit_status {
    int  code   = -1; // exit code when exited normally
    int  signal = 0;  // terminating signal, 0 if none

    bool success() const { return signal == 0 && code == 0; }

    std::string to_string() const;
};

// Byte-stream endpoints to one peer, plus whatever lifetime the peer has.
// Reads happen on a single thread; writes are serialized by the caller.
class Transport {
public:
    using exit_callback = std::function<void(const exit_status &)>;

    virtual ~Transport() = default;

    // start background supervision, on_exit runs once when the peer goes away
    virtual void start(exit_callback on_exit) { (void) on_exit; }

    // read up to n bytes, blocks until data is available
    // returns 0 at end of stream or after close_read()
    virtual size_t read(char * buf, size_t n) = 0;

    // write the whole buffer with a single call, throws TransportClosedError on failure
    // or if it cannot complete within timeout_ms (-1 - no limit)
    virtual void write(const char * buf, size_t n, int timeout_ms = -1) = 0;

    virtual void close_write() = 0;

    // also wakes up a reader blocked in read()
    virtual void close_read() = 0;

    // peer lifetime, no-ops for transports that do not own a process
    virtual bool exited() const { return false; }
    virtual void kill() {}
    virtual exit_status wait() { return exit_status{0, 0}; }
    virtual bool wait_for(int timeout_ms) { (void) timeout_ms; return true; }

    // joins background threads, called once the peer is known to be gone
    virtual void join() {}
};

} // namespace mcp
