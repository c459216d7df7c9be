#pragma once

#include "mcp-cancel.hpp"
#include "mcp-framing.hpp"
#include "mcp-message.hpp"
#include "mcp-params.hpp"
#include "mcp-transport.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcp {

enum class session_state {
    open,
    closing,
    closed,
};

const char * session_state_name(session_state state);

struct call_options {
    CancelToken cancel;          // cancels only this call
    int32_t     timeout_ms = -1; // -1 - use mcp_session_params::call_timeout_ms, 0 - no timeout
};

/**
 * One protocol session with one peer over one transport.
 *
 * A dedicated thread runs the read loop: responses are matched to pending calls by id,
 * requests and notifications from the peer go to the registered handlers. call() and
 * notify() can be used from any number of threads.
 *
 * The session is open after start() and ends in closed after close(), which also happens
 * when the peer process exits. Calls still pending at that point fail with
 * TransportClosedError, new calls fail with SessionClosedError.
 */
class Session {
public:
    // return the result, or throw CallError to answer with an error object
    using request_handler      = std::function<json(const json & params)>;
    using notification_handler = std::function<void(const json & params)>;

    Session(std::unique_ptr<Transport> transport,
            const mcp_session_params & params = {},
            const CancelToken & parent = CancelToken());
    ~Session();

    Session(const Session &) = delete;
    Session & operator=(const Session &) = delete;

    // spawn the peer and return a started session
    static std::unique_ptr<Session> spawn(const std::string & command,
                                          const std::vector<std::string> & args = {},
                                          const mcp_session_params & params = {},
                                          const CancelToken & parent = CancelToken());

    // start transport supervision and the read loop, must happen before the first call
    void start();

    json call(const std::string & method, const json & params = nullptr, const call_options & opts = call_options());

    void notify(const std::string & method, const json & params = nullptr);

    // idempotent, never throws, bounded even when the peer stopped reading
    void close();

    // block until the read loop has stopped
    void wait_closed();

    // handlers run on the read loop thread and must not wait for responses from the peer
    void set_request_handler     (const std::string & method, request_handler handler);
    void set_notification_handler(const std::string & method, notification_handler handler);

    session_state state() const;
    size_t        n_pending() const;

    CancelToken token() const { return scope_.token(); }

    Transport & transport() { return *transport_; }

private:
    struct pending_request;

    void read_loop();

    void dispatch_response    (const message & msg);
    void dispatch_request     (const message & msg);
    void dispatch_notification(const message & msg);

    // write without checking the session state
    void send(const message & msg);

    // best-effort write bounded by timeout_ms, returns false if it did not go out
    bool try_send(const message & msg, int timeout_ms);
    void send_reply(const message & msg);

    // move to closing, fail every pending call and wake the read loop
    void begin_teardown(const std::string & reason);
    void fail_pending(const std::string & reason);
    void remove_pending(int64_t id);

    mcp_session_params params_;

    std::unique_ptr<Transport> transport_;
    Framer                     framer_;

    CancelSource                    scope_;
    std::unique_ptr<CancelCallback> scope_link_;

    // guards state_, pending_, next_id_ and reader_done_
    mutable std::mutex      mtx_;
    std::condition_variable done_cv_;

    session_state state_       = session_state::open;
    bool          started_     = false;
    bool          reader_done_ = false;
    int64_t       next_id_     = 1;

    std::unordered_map<int64_t, std::shared_ptr<pending_request>> pending_;

    // one encode+write at a time
    std::timed_mutex write_mtx_;

    std::mutex handlers_mtx_;
    std::map<std::string, request_handler>      request_handlers_;
    std::map<std::string, notification_handler> notification_handlers_;

    std::mutex  close_mtx_;
    std::thread reader_;
};

} // namespace mcp
