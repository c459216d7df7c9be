#pragma once

// file descriptor helpers shared by the pipe-backed transports

#include <cstddef>

namespace mcp {
namespace detail {

// A pipe used to wake up a thread blocked in poll(). Once notified it stays readable.
class wake_pipe {
public:
    wake_pipe();
    ~wake_pipe();

    wake_pipe(const wake_pipe &) = delete;
    wake_pipe & operator=(const wake_pipe &) = delete;

    void notify();
    bool notified() const;

    int fd() const { return fds_[0]; }

private:
    int fds_[2];
};

// Read up to n bytes from fd, blocking until data arrives or wake is notified.
// With drain set, pending data is still returned after wake is notified.
// Returns 0 at end of stream or when woken up, throws TransportClosedError on read errors.
size_t poll_read(int fd, const wake_pipe & wake, char * buf, size_t n, bool drain);

// Write the whole buffer, blocking while the pipe is full, for at most timeout_ms (-1 - no limit).
// Throws TransportClosedError on failure, on timeout or when wake is notified before completion.
void poll_write_all(int fd, const wake_pipe & wake, const char * buf, size_t n, int timeout_ms);

void close_fd(int & fd);

} // namespace detail
} // namespace mcp
