#include "mcp/stdio-transport.hpp"

#include "mcp-fd.hpp"

namespace mcp {

StdioTransport::StdioTransport(int in_fd, int out_fd)
    : in_fd_(in_fd), out_fd_(out_fd), in_wake_(new detail::wake_pipe()), out_wake_(new detail::wake_pipe()) {
}

StdioTransport::~StdioTransport() {
    close_write();
}

size_t StdioTransport::read(char * buf, size_t n) {
    return detail::poll_read(in_fd_, *in_wake_, buf, n, false);
}

void StdioTransport::write(const char * buf, size_t n, int timeout_ms) {
    std::lock_guard<std::mutex> lock(out_mtx_);
    detail::poll_write_all(out_fd_, *out_wake_, buf, n, timeout_ms);
}

void StdioTransport::close_write() {
    out_wake_->notify();

    std::lock_guard<std::mutex> lock(out_mtx_);
    detail::close_fd(out_fd_);
}

void StdioTransport::close_read() {
    in_wake_->notify();
}

} // namespace mcp
