#pragma once

// in-memory transport pair for driving a Session without a child process

#include "mcp/mcp-error.hpp"
#include "mcp/mcp-framing.hpp"
#include "mcp/mcp-transport.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace mcp_test {

// one direction of the connection
class byte_pipe {
public:
    void push(const char * buf, size_t n) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                throw mcp::TransportClosedError("pipe closed");
            }
            data_.append(buf, n);
        }
        cv_.notify_all();
    }

    // blocks until data arrives, 0 once closed and drained
    size_t pop(char * buf, size_t n) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !data_.empty() || closed_; });
        if (data_.empty()) {
            return 0;
        }
        const size_t count = std::min(n, data_.size());
        memcpy(buf, data_.data(), count);
        data_.erase(0, count);
        return count;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex              mtx_;
    std::condition_variable cv_;
    std::string             data_;
    bool                    closed_ = false;
};

class MemoryTransport : public mcp::Transport {
public:
    MemoryTransport(std::shared_ptr<byte_pipe> in, std::shared_ptr<byte_pipe> out)
        : in_(std::move(in)), out_(std::move(out)) {}

    size_t read(char * buf, size_t n) override {
        return in_->pop(buf, n);
    }

    // the pipe is unbounded, writes never wait
    void write(const char * buf, size_t n, int timeout_ms = -1) override {
        (void) timeout_ms;
        n_writes++;
        out_->push(buf, n);
    }

    void close_write() override {
        out_->close();
    }

    void close_read() override {
        in_->close();
    }

    std::atomic<int> n_writes{0};

private:
    std::shared_ptr<byte_pipe> in_;
    std::shared_ptr<byte_pipe> out_;
};

inline std::pair<std::unique_ptr<MemoryTransport>, std::unique_ptr<MemoryTransport>> make_memory_pair() {
    auto a_to_b = std::make_shared<byte_pipe>();
    auto b_to_a = std::make_shared<byte_pipe>();

    return std::make_pair(
        std::unique_ptr<MemoryTransport>(new MemoryTransport(b_to_a, a_to_b)),
        std::unique_ptr<MemoryTransport>(new MemoryTransport(a_to_b, b_to_a)));
}

// the other end of a session under test, driven by the test itself
struct test_peer {
    std::unique_ptr<MemoryTransport> transport;
    mcp::Framer                      framer;

    explicit test_peer(std::unique_ptr<MemoryTransport> t)
        : transport(std::move(t)), framer(*transport) {}

    mcp::message read() {
        return framer.read();
    }

    void write(const mcp::message & msg) {
        framer.write(msg);
    }

    void write_raw(const std::string & data) {
        transport->write(data.data(), data.size());
    }
};

template <typename E, typename F>
bool throws(F && fn) {
    try {
        fn();
    } catch (const E &) {
        return true;
    }
    return false;
}

} // namespace mcp_test
