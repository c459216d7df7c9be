#include "mcp-fd.hpp"

#include "mcp/mcp-error.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mcp {
namespace detail {

static std::string errno_string(const char * what) {
    return std::string(what) + ": " + strerror(errno);
}

wake_pipe::wake_pipe() {
    if (pipe2(fds_, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw Error(errno_string("failed to create wake pipe"));
    }
}

wake_pipe::~wake_pipe() {
    close_fd(fds_[0]);
    close_fd(fds_[1]);
}

void wake_pipe::notify() {
    const char c = 1;
    // the pipe is non-blocking, a full pipe is already readable
    while (::write(fds_[1], &c, 1) == -1 && errno == EINTR) {
    }
}

bool wake_pipe::notified() const {
    struct pollfd pfd = { fds_[0], POLLIN, 0 };
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
}

size_t poll_read(int fd, const wake_pipe & wake, char * buf, size_t n, bool drain) {
    if (fd < 0) {
        return 0;
    }

    for (;;) {
        struct pollfd pfds[2] = {
            { fd,        POLLIN, 0 },
            { wake.fd(), POLLIN, 0 },
        };

        const int rc = ::poll(pfds, 2, -1);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportClosedError(errno_string("poll"));
        }

        const bool woken    = (pfds[1].revents & POLLIN) != 0;
        const bool readable = (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0;

        if (woken && !(drain && readable)) {
            return 0;
        }
        if (!readable) {
            continue;
        }

        const ssize_t nread = ::read(fd, buf, n);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw TransportClosedError(errno_string("read"));
        }
        return (size_t) nread;
    }
}

void poll_write_all(int fd, const wake_pipe & wake, const char * buf, size_t n, int timeout_ms) {
    if (fd < 0) {
        throw TransportClosedError("write side closed");
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

    size_t written = 0;
    while (written < n) {
        struct pollfd pfds[2] = {
            { fd,        POLLOUT, 0 },
            { wake.fd(), POLLIN,  0 },
        };

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            wait_ms = (int) std::max<int64_t>(left.count(), 0);
        }

        const int rc = ::poll(pfds, 2, wait_ms);
        if (rc == 0) {
            throw TransportClosedError("write timed out after " + std::to_string(timeout_ms) + " ms");
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw TransportClosedError(errno_string("poll"));
        }
        if (pfds[1].revents & POLLIN) {
            throw TransportClosedError("write side closed");
        }
        if (pfds[0].revents & (POLLERR | POLLHUP)) {
            throw TransportClosedError("peer closed its input");
        }
        if (!(pfds[0].revents & POLLOUT)) {
            continue;
        }

        const ssize_t nwritten = ::write(fd, buf + written, n - written);
        if (nwritten == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw TransportClosedError(errno_string("write"));
        }
        written += (size_t) nwritten;
    }
}

void close_fd(int & fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace detail
} // namespace mcp
