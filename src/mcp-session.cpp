#include "mcp/mcp-session.hpp"
#include "mcp/mcp-error.hpp"
#include "mcp/mcp-log.hpp"
#include "mcp/process-transport.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace mcp {

const char * session_state_name(session_state state) {
    switch (state) {
        case session_state::open:    return "open";
        case session_state::closing: return "closing";
        case session_state::closed:  return "closed";
    }
    return "unknown";
}

// one-shot completion slot, the first fulfill() or fail() wins
struct Session::pending_request {
    int64_t     id = 0;
    std::string method;

    std::chrono::steady_clock::time_point created = std::chrono::steady_clock::now();

    std::mutex              mtx;
    std::condition_variable cv;

    bool               done = false;
    json               result;
    std::exception_ptr error;

    bool fulfill(json value) {
        std::lock_guard<std::mutex> lock(mtx);
        if (done) {
            return false;
        }
        done   = true;
        result = std::move(value);
        cv.notify_all();
        return true;
    }

    bool fail(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(mtx);
        if (done) {
            return false;
        }
        done  = true;
        error = std::move(e);
        cv.notify_all();
        return true;
    }

    // returns false if timeout_ms elapsed first, 0 waits without a deadline
    bool wait(int32_t timeout_ms) {
        std::unique_lock<std::mutex> lock(mtx);
        if (timeout_ms <= 0) {
            cv.wait(lock, [this] { return done; });
            return true;
        }
        return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return done; });
    }

    json get() {
        std::lock_guard<std::mutex> lock(mtx);
        if (error) {
            std::rethrow_exception(error);
        }
        return result;
    }

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - created).count();
    }
};

Session::Session(std::unique_ptr<Transport> transport, const mcp_session_params & params, const CancelToken & parent)
    : params_(params), transport_(std::move(transport)), framer_(*transport_, params.log_frames), scope_(parent) {
    scope_link_.reset(new CancelCallback(scope_.token(), [this]() {
        begin_teardown("session cancelled");
    }));
}

Session::~Session() {
    scope_link_.reset();
    close();

    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
    transport_->join();
}

std::unique_ptr<Session> Session::spawn(const std::string & command,
                                        const std::vector<std::string> & args,
                                        const mcp_session_params & params,
                                        const CancelToken & parent) {
    std::unique_ptr<Transport> transport = ProcessTransport::spawn(command, args, params);

    std::unique_ptr<Session> session(new Session(std::move(transport), params, parent));
    session->start();

    return session;
}

void Session::start() {
    // a peer that is already gone makes the exit watcher call close() right away
    std::lock_guard<std::mutex> close_lock(close_mtx_);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (started_) {
            return;
        }
        if (state_ != session_state::open) {
            throw SessionClosedError("session is " + std::string(session_state_name(state_)));
        }
        started_ = true;
    }

    reader_ = std::thread(&Session::read_loop, this);

    transport_->start([this](const exit_status & status) {
        MCP_LOG_DEBUG("%s: peer exited (%s), closing session\n", __func__, status.to_string().c_str());
        close();
    });
}

json Session::call(const std::string & method, const json & params, const call_options & opts) {
    if (opts.cancel.cancelled()) {
        throw CancellationError(opts.cancel.reason());
    }

    auto req = std::make_shared<pending_request>();
    req->method = method;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != session_state::open) {
            throw SessionClosedError("session is " + std::string(session_state_name(state_)));
        }
        req->id = next_id_++;
        pending_[req->id] = req;
    }

    try {
        send(message::request(req->id, method, params));
    } catch (...) {
        remove_pending(req->id);
        throw;
    }

    const int32_t timeout_ms = opts.timeout_ms < 0 ? params_.call_timeout_ms : opts.timeout_ms;

    {
        const CancelToken & cancel = opts.cancel;
        CancelCallback on_cancel(cancel, [req, &cancel]() {
            req->fail(std::make_exception_ptr(CancellationError(cancel.reason())));
        });

        if (!req->wait(timeout_ms)) {
            req->fail(std::make_exception_ptr(
                CancellationError(method + " timed out after " + std::to_string(timeout_ms) + " ms")));
        }
    }

    remove_pending(req->id);

    return req->get();
}

void Session::notify(const std::string & method, const json & params) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != session_state::open) {
            throw SessionClosedError("session is " + std::string(session_state_name(state_)));
        }
    }

    send(message::notification(method, params));
}

void Session::send(const message & msg) {
    std::lock_guard<std::timed_mutex> lock(write_mtx_);
    framer_.write(msg);
}

bool Session::try_send(const message & msg, int timeout_ms) {
    const auto t_start = std::chrono::steady_clock::now();

    std::unique_lock<std::timed_mutex> lock(write_mtx_, std::chrono::milliseconds(timeout_ms));
    if (!lock.owns_lock()) {
        MCP_LOG_DEBUG("%s: %s not sent: another write is blocked\n", __func__, msg.method.c_str());
        return false;
    }

    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t_start);
    const int  left   = std::max(0, timeout_ms - (int) waited.count());

    try {
        framer_.write(msg, left);
    } catch (const Error & e) {
        MCP_LOG_DEBUG("%s: %s not sent: %s\n", __func__, msg.method.c_str(), e.what());
        return false;
    }
    return true;
}

void Session::send_reply(const message & msg) {
    try {
        send(msg);
    } catch (const TransportClosedError & e) {
        MCP_LOG_WARN("%s: failed to reply to request %s: %s\n", __func__, msg.id.dump().c_str(), e.what());
    }
}

void Session::read_loop() {
    const CancelToken token = scope_.token();

    std::string reason;
    for (;;) {
        message msg;
        try {
            msg = framer_.read(token);
        } catch (const CancellationError &) {
            reason = "session cancelled";
            break;
        } catch (const TransportClosedError &) {
            reason = "end of stream";
            break;
        } catch (const FramingError & e) {
            MCP_LOG_ERROR("%s: %s, stopping\n", __func__, e.what());
            reason = std::string("framing error: ") + e.what();
            break;
        }

        switch (msg.type) {
            case message_type::response:     dispatch_response(msg);     break;
            case message_type::request:      dispatch_request(msg);      break;
            case message_type::notification: dispatch_notification(msg); break;
        }
    }

    MCP_LOG_DEBUG("%s: read loop stopped: %s\n", __func__, reason.c_str());

    begin_teardown(reason);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        reader_done_ = true;
    }
    done_cv_.notify_all();
}

void Session::dispatch_response(const message & msg) {
    if (!msg.id.is_number_integer()) {
        MCP_LOG_WARN("%s: discarding response with unexpected id %s\n", __func__, msg.id.dump().c_str());
        return;
    }

    const int64_t id = msg.id.get<int64_t>();

    std::shared_ptr<pending_request> req;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            MCP_LOG_WARN("%s: discarding response for unknown request id %lld\n", __func__, (long long) id);
            return;
        }
        req = it->second;
        pending_.erase(it);
    }

    MCP_LOG_DEBUG("%s: %s (id %lld) answered after %lld ms\n", __func__,
            req->method.c_str(), (long long) id, (long long) req->elapsed_ms());

    if (msg.is_error()) {
        req->fail(std::make_exception_ptr(CallError::from_json(msg.error)));
    } else {
        req->fulfill(msg.result);
    }
}

void Session::dispatch_request(const message & msg) {
    request_handler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mtx_);
        auto it = request_handlers_.find(msg.method);
        if (it != request_handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        MCP_LOG_WARN("%s: no handler for request '%s'\n", __func__, msg.method.c_str());
        send_reply(message::error_response(msg.id,
                    CallError(ERROR_METHOD_NOT_FOUND, "Method not found: " + msg.method).to_json()));
        return;
    }

    try {
        json result = handler(msg.params);
        send_reply(message::response(msg.id, result.is_null() ? json::object() : result));
    } catch (const CallError & e) {
        send_reply(message::error_response(msg.id, e.to_json()));
    } catch (const std::exception & e) {
        MCP_LOG_ERROR("%s: handler for '%s' failed: %s\n", __func__, msg.method.c_str(), e.what());
        send_reply(message::error_response(msg.id, CallError(ERROR_INTERNAL, e.what()).to_json()));
    }
}

void Session::dispatch_notification(const message & msg) {
    notification_handler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mtx_);
        auto it = notification_handlers_.find(msg.method);
        if (it != notification_handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        MCP_LOG_DEBUG("%s: dropping notification '%s'\n", __func__, msg.method.c_str());
        return;
    }

    try {
        handler(msg.params);
    } catch (const std::exception & e) {
        MCP_LOG_ERROR("%s: handler for '%s' failed: %s\n", __func__, msg.method.c_str(), e.what());
    }
}

void Session::begin_teardown(const std::string & reason) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ == session_state::open) {
            MCP_LOG_DEBUG("%s: session closing: %s\n", __func__, reason.c_str());
            state_ = session_state::closing;
        }
    }

    fail_pending(reason);

    transport_->close_read();
}

void Session::fail_pending(const std::string & reason) {
    std::unordered_map<int64_t, std::shared_ptr<pending_request>> pending;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        pending.swap(pending_);
    }

    for (auto & it : pending) {
        MCP_LOG_DEBUG("%s: failing %s (id %lld): %s\n", __func__,
                it.second->method.c_str(), (long long) it.first, reason.c_str());
        it.second->fail(std::make_exception_ptr(TransportClosedError(reason)));
    }
}

void Session::remove_pending(int64_t id) {
    std::lock_guard<std::mutex> lock(mtx_);
    pending_.erase(id);
}

void Session::close() {
    std::lock_guard<std::mutex> close_lock(close_mtx_);

    bool started;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ == session_state::closed) {
            return;
        }
        started = started_;
    }

    MCP_LOG_DEBUG("%s: closing session\n", __func__);

    // no new calls, outstanding ones fail now rather than after the peer is gone
    begin_teardown("session closed");

    // the exit notification is the last message we send, a peer that stopped reading does not get it
    if (params_.send_exit_on_close && !transport_->exited()) {
        try_send(message::notification("exit"), params_.kill_grace_ms);
    }

    // also wakes a caller blocked writing to a full pipe
    transport_->close_write();
    transport_->close_read();

    scope_.cancel("session closed");

    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }

    if (started) {
        if (!transport_->wait_for(params_.kill_grace_ms)) {
            transport_->kill();
        }
        const exit_status status = transport_->wait();
        MCP_LOG_DEBUG("%s: peer %s\n", __func__, status.to_string().c_str());
    } else {
        transport_->kill();
    }

    fail_pending("session closed");

    {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = session_state::closed;
    }
    done_cv_.notify_all();

    MCP_LOG_DEBUG("%s: session closed\n", __func__);
}

void Session::wait_closed() {
    std::unique_lock<std::mutex> lock(mtx_);
    done_cv_.wait(lock, [this] {
        return reader_done_ || state_ == session_state::closed;
    });
}

void Session::set_request_handler(const std::string & method, request_handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mtx_);
    request_handlers_[method] = std::move(handler);
}

void Session::set_notification_handler(const std::string & method, notification_handler handler) {
    std::lock_guard<std::mutex> lock(handlers_mtx_);
    notification_handlers_[method] = std::move(handler);
}

session_state Session::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

size_t Session::n_pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

} // namespace mcp
