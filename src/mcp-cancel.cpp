#include "mcp/mcp-cancel.hpp"
#include "mcp/mcp-log.hpp"

#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <thread>

namespace mcp {
namespace detail {

struct cancel_state {
    std::mutex              mtx;
    std::condition_variable cv;

    bool        cancelled = false;
    std::string reason;

    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;

    // callback currently being invoked by cancel()
    uint64_t        running_id = 0;
    std::thread::id running_thread;

    bool cancel(const std::string & why) {
        std::unique_lock<std::mutex> lock(mtx);
        if (cancelled) {
            return false;
        }
        cancelled = true;
        reason    = why;

        while (!callbacks.empty()) {
            auto it = callbacks.begin();
            running_id     = it->first;
            running_thread = std::this_thread::get_id();
            std::function<void()> fn = std::move(it->second);
            callbacks.erase(it);

            lock.unlock();
            try {
                fn();
            } catch (const std::exception & e) {
                MCP_LOG_ERROR("%s: cancellation callback failed: %s\n", __func__, e.what());
            }
            lock.lock();

            running_id = 0;
            cv.notify_all();
        }

        return true;
    }

    // returns 0 if already cancelled, the callback is not stored in that case
    uint64_t add(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mtx);
        if (cancelled) {
            return 0;
        }
        const uint64_t id = next_id++;
        callbacks.emplace(id, std::move(fn));
        return id;
    }

    void remove(uint64_t id) {
        std::unique_lock<std::mutex> lock(mtx);
        if (callbacks.erase(id) > 0) {
            return;
        }
        if (running_id == id && running_thread != std::this_thread::get_id()) {
            cv.wait(lock, [&] { return running_id != id; });
        }
    }
};

} // namespace detail

bool CancelToken::cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->cancelled;
}

std::string CancelToken::reason() const {
    if (!state_) {
        return std::string();
    }
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->reason;
}

CancelCallback::CancelCallback(const CancelToken & token, std::function<void()> fn)
    : state_(token.state_) {
    if (!state_) {
        return;
    }
    id_ = state_->add(fn);
    if (id_ == 0) {
        fn();
    }
}

CancelCallback::~CancelCallback() {
    if (state_ && id_ != 0) {
        state_->remove(id_);
    }
}

CancelSource::CancelSource()
    : state_(std::make_shared<detail::cancel_state>()) {
}

CancelSource::CancelSource(const CancelToken & parent)
    : state_(std::make_shared<detail::cancel_state>()) {
    if (!parent.can_be_cancelled()) {
        return;
    }
    std::weak_ptr<detail::cancel_state> child = state_;
    CancelToken parent_copy = parent;
    parent_link_.reset(new CancelCallback(parent, [child, parent_copy]() {
        if (auto state = child.lock()) {
            state->cancel(parent_copy.reason());
        }
    }));
}

CancelSource::~CancelSource() {
    parent_link_.reset();
}

bool CancelSource::cancel(const std::string & reason) {
    return state_->cancel(reason);
}

bool CancelSource::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->cancelled;
}

} // namespace mcp
