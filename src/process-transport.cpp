#include "mcp/process-transport.hpp"
#include "mcp/mcp-error.hpp"
#include "mcp/mcp-log.hpp"

#include "mcp-fd.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp {

std::string exit_status::to_string() const {
    if (signal != 0) {
        return "killed by signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
    }
    if (code < 0) {
        return "unknown exit status";
    }
    return "exit code " + std::to_string(code);
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char) std::tolower(c); });
    return s;
}

static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        // a peer that dies must surface as a write error, not terminate us
        signal(SIGPIPE, SIG_IGN);
    });
}

std::unique_ptr<ProcessTransport> ProcessTransport::spawn(const std::string & command,
                                                          const std::vector<std::string> & args,
                                                          const mcp_session_params & params) {
    if (command.empty()) {
        throw SpawnError("empty command");
    }

    ignore_sigpipe();

    int stdin_pipe[2]  = { -1, -1 };
    int stdout_pipe[2] = { -1, -1 };
    int stderr_pipe[2] = { -1, -1 };
    int status_pipe[2] = { -1, -1 };

    auto close_all = [&]() {
        for (int * p : { stdin_pipe, stdout_pipe, stderr_pipe, status_pipe }) {
            detail::close_fd(p[0]);
            detail::close_fd(p[1]);
        }
    };

    // all pipes exist before the child runs, so no output can be lost
    if (pipe2(stdin_pipe,  O_CLOEXEC) == -1 ||
        pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        pipe2(stderr_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        const int err = errno;
        close_all();
        throw SpawnError(std::string("failed to create pipes: ") + strerror(err));
    }

    // prepare arguments before fork, the child only calls async-signal-safe functions
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command.c_str()));
    for (const auto & arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid == -1) {
        const int err = errno;
        close_all();
        throw SpawnError(std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        // child process - become the peer
        signal(SIGPIPE, SIG_DFL);

        if (dup2(stdin_pipe[0],  STDIN_FILENO)  == -1 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
            const int err = errno;
            (void) !::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        // every other descriptor is close-on-exec
        execvp(argv[0], argv.data());

        const int err = errno;
        (void) !::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // parent process
    detail::close_fd(stdin_pipe[0]);
    detail::close_fd(stdout_pipe[1]);
    detail::close_fd(stderr_pipe[1]);
    detail::close_fd(status_pipe[1]);

    // the status pipe closes on a successful exec, otherwise it carries errno
    int     exec_errno = 0;
    ssize_t nread;
    do {
        nread = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (nread == -1 && errno == EINTR);
    detail::close_fd(status_pipe[0]);

    if (nread > 0) {
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        close_all();
        throw SpawnError(command + ": " + strerror(exec_errno));
    }

    // writes must not block forever once close_write() is requested
    const int flags = fcntl(stdin_pipe[1], F_GETFL, 0);
    fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK);

    MCP_LOG_INFO("%s: started '%s', pid %d\n", __func__, command.c_str(), (int) pid);

    return std::unique_ptr<ProcessTransport>(
        new ProcessTransport(command, pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0], params));
}

ProcessTransport::ProcessTransport(const std::string & command, pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                                   const mcp_session_params & params)
    : command_(command), pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd),
      stdin_wake_(new detail::wake_pipe()), stdout_wake_(new detail::wake_pipe()), stderr_wake_(new detail::wake_pipe()),
      exit_future_(exit_promise_.get_future().share()) {
    for (const auto & marker : params.stderr_error_markers) {
        if (!marker.empty()) {
            stderr_markers_.push_back(lowercase(marker));
        }
    }
}

ProcessTransport::~ProcessTransport() {
    bool started;
    {
        std::lock_guard<std::mutex> lock(exit_mtx_);
        started = started_;
    }

    if (started) {
        join();
    } else {
        // nobody is watching the child, reap it here
        {
            std::lock_guard<std::mutex> lock(exit_mtx_);
            if (!exited_) {
                ::kill(pid_, SIGKILL);
                exited_ = true;
            }
        }
        int status;
        while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
        }
    }

    detail::close_fd(stdin_fd_);
    detail::close_fd(stdout_fd_);
    detail::close_fd(stderr_fd_);
}

void ProcessTransport::start(exit_callback on_exit) {
    std::lock_guard<std::mutex> lock(exit_mtx_);
    if (started_) {
        return;
    }
    started_ = true;
    on_exit_ = std::move(on_exit);

    watcher_        = std::thread(&ProcessTransport::watch_exit, this);
    stderr_monitor_ = std::thread(&ProcessTransport::monitor_stderr, this);
}

void ProcessTransport::watch_exit() {
    // observe the exit without reaping, so kill() can never hit a recycled pid
    for (;;) {
        siginfo_t info;
        memset(&info, 0, sizeof(info));
        if (waitid(P_PID, (id_t) pid_, &info, WEXITED | WNOWAIT) == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        MCP_LOG_ERROR("%s: waitid failed for pid %d: %s\n", __func__, (int) pid_, strerror(errno));
        break;
    }

    {
        std::lock_guard<std::mutex> lock(exit_mtx_);
        exited_ = true;
    }

    exit_status result;
    int status = 0;
    pid_t rc;
    while ((rc = waitpid(pid_, &status, 0)) == -1 && errno == EINTR) {
    }
    if (rc == pid_) {
        if (WIFEXITED(status)) {
            result.code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
    }

    if (result.success()) {
        MCP_LOG_DEBUG("%s: '%s' (pid %d) exited: %s\n", __func__, command_.c_str(), (int) pid_, result.to_string().c_str());
    } else {
        MCP_LOG_WARN("%s: '%s' (pid %d) exited: %s\n", __func__, command_.c_str(), (int) pid_, result.to_string().c_str());
    }

    exit_promise_.set_value(result);

    if (on_exit_) {
        on_exit_(result);
    }
}

void ProcessTransport::monitor_stderr() {
    char buf[4096];
    std::string pending;

    for (;;) {
        size_t n;
        try {
            n = detail::poll_read(stderr_fd_, *stderr_wake_, buf, sizeof(buf), true);
        } catch (const TransportClosedError & e) {
            MCP_LOG_ERROR("%s: error reading stderr: %s\n", __func__, e.what());
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buf, n);

        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            log_stderr_line(pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }

    if (!pending.empty()) {
        log_stderr_line(pending);
    }
}

void ProcessTransport::log_stderr_line(const std::string & raw) const {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }

    MCP_LOG_DEBUG("[%s stderr] %s\n", command_.c_str(), line.c_str());

    const std::string lower = lowercase(line);
    for (const auto & marker : stderr_markers_) {
        if (lower.find(marker) != std::string::npos) {
            MCP_LOG_ERROR("%s: peer reported: %s\n", __func__, line.c_str());
            break;
        }
    }
}

size_t ProcessTransport::read(char * buf, size_t n) {
    return detail::poll_read(stdout_fd_, *stdout_wake_, buf, n, false);
}

void ProcessTransport::write(const char * buf, size_t n, int timeout_ms) {
    std::lock_guard<std::mutex> lock(stdin_mtx_);
    detail::poll_write_all(stdin_fd_, *stdin_wake_, buf, n, timeout_ms);
}

void ProcessTransport::close_write() {
    // wake a writer blocked on a full pipe before taking its lock
    stdin_wake_->notify();

    std::lock_guard<std::mutex> lock(stdin_mtx_);
    detail::close_fd(stdin_fd_);
}

void ProcessTransport::close_read() {
    // the descriptor itself is closed in the destructor, once no thread can be polling it
    stdout_wake_->notify();
}

bool ProcessTransport::exited() const {
    std::lock_guard<std::mutex> lock(exit_mtx_);
    return exited_;
}

void ProcessTransport::kill() {
    std::lock_guard<std::mutex> lock(exit_mtx_);
    if (exited_) {
        return;
    }
    MCP_LOG_DEBUG("%s: sending SIGKILL to pid %d\n", __func__, (int) pid_);
    if (::kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
        MCP_LOG_ERROR("%s: failed to kill pid %d: %s\n", __func__, (int) pid_, strerror(errno));
    }
}

exit_status ProcessTransport::wait() {
    return exit_future_.get();
}

bool ProcessTransport::wait_for(int timeout_ms) {
    return exit_future_.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
}

void ProcessTransport::join() {
    bool started;
    {
        std::lock_guard<std::mutex> lock(exit_mtx_);
        started = started_;
    }
    if (!started) {
        return;
    }

    kill();

    if (watcher_.joinable()) {
        if (watcher_.get_id() != std::this_thread::get_id()) {
            watcher_.join();
        } else {
            // released from within the exit callback
            watcher_.detach();
        }
    }

    // let the monitor drain what is left, then stop it even if a grandchild holds the pipe
    stderr_wake_->notify();
    if (stderr_monitor_.joinable()) {
        stderr_monitor_.join();
    }
}

} // namespace mcp
