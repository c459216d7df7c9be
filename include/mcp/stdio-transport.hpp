#pragma once

#include "mcp-transport.hpp"

#include <memory>
#include <mutex>

#include <unistd.h>

namespace mcp {

namespace detail {
class wake_pipe;
}

// Transport over our own stdin/stdout, used when this process is the peer.
class StdioTransport : public Transport {
public:
    explicit StdioTransport(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);
    ~StdioTransport() override;

    size_t read(char * buf, size_t n) override;
    void   write(const char * buf, size_t n, int timeout_ms = -1) override;

    void close_write() override;
    void close_read() override;

private:
    int in_fd_;
    int out_fd_;

    std::unique_ptr<detail::wake_pipe> in_wake_;
    std::unique_ptr<detail::wake_pipe> out_wake_;

    std::mutex out_mtx_;
};

} // namespace mcp
