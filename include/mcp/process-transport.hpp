#pragma once

#include "mcp-params.hpp"
#include "mcp-transport.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcp {

namespace detail {
class wake_pipe;
}

// Transport to a spawned child process: we write to its stdin and read its stdout,
// its stderr is monitored for diagnostics.
class ProcessTransport : public Transport {
public:
    // throws SpawnError if the pipes cannot be created or the command cannot be executed
    static std::unique_ptr<ProcessTransport> spawn(const std::string & command,
                                                   const std::vector<std::string> & args = {},
                                                   const mcp_session_params & params = {});

    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport &) = delete;
    ProcessTransport & operator=(const ProcessTransport &) = delete;

    void start(exit_callback on_exit) override;

    size_t read(char * buf, size_t n) override;
    void   write(const char * buf, size_t n, int timeout_ms = -1) override;

    void close_write() override;
    void close_read() override;

    bool exited() const override;

    // SIGKILL unless the process already exited
    void kill() override;

    exit_status wait() override;
    bool wait_for(int timeout_ms) override;

    void join() override;

    pid_t pid() const { return pid_; }
    const std::string & command() const { return command_; }

private:
    ProcessTransport(const std::string & command, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                     const mcp_session_params & params);

    void watch_exit();
    void monitor_stderr();
    void log_stderr_line(const std::string & line) const;

    std::string command_;
    pid_t       pid_;

    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::unique_ptr<detail::wake_pipe> stdin_wake_;
    std::unique_ptr<detail::wake_pipe> stdout_wake_;
    std::unique_ptr<detail::wake_pipe> stderr_wake_;

    // guards stdin_fd_ against close_write while a write is in progress
    std::mutex stdin_mtx_;

    // guards exited_, the process is reaped only after exited_ is set
    mutable std::mutex exit_mtx_;
    bool exited_  = false;
    bool started_ = false;

    std::promise<exit_status>     exit_promise_;
    std::shared_future<exit_status> exit_future_;
    exit_callback                 on_exit_;

    std::vector<std::string> stderr_markers_;

    std::thread watcher_;
    std::thread stderr_monitor_;
};

} // namespace mcp
