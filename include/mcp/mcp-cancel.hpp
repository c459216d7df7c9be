#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcp {

namespace detail {
struct cancel_state;
}

class CancelSource;
class CancelCallback;

// Read side of a cancellation scope. A default constructed token is never cancelled.
class CancelToken {
public:
    CancelToken() = default;

    bool cancelled() const;
    bool can_be_cancelled() const { return state_ != nullptr; }

    // reason passed to CancelSource::cancel, empty while not cancelled
    std::string reason() const;

private:
    friend class CancelSource;
    friend class CancelCallback;

    explicit CancelToken(std::shared_ptr<detail::cancel_state> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

// Runs a function once when the token is cancelled, right away if it already is.
// The destructor unregisters it and, if the function is running on another thread,
// waits for it to return.
class CancelCallback {
public:
    CancelCallback(const CancelToken & token, std::function<void()> fn);
    ~CancelCallback();

    CancelCallback(const CancelCallback &) = delete;
    CancelCallback & operator=(const CancelCallback &) = delete;

private:
    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

// Owning side of a cancellation scope, optionally derived from a parent scope:
// cancelling the parent cancels this source, cancelling this source leaves the parent alone.
class CancelSource {
public:
    CancelSource();
    explicit CancelSource(const CancelToken & parent);
    ~CancelSource();

    CancelSource(const CancelSource &) = delete;
    CancelSource & operator=(const CancelSource &) = delete;

    // returns false if the scope was already cancelled
    bool cancel(const std::string & reason = "cancelled");
    bool cancelled() const;

    CancelToken token() const { return CancelToken(state_); }

private:
    std::shared_ptr<detail::cancel_state> state_;
    std::unique_ptr<CancelCallback>       parent_link_;
};

} // namespace mcp
