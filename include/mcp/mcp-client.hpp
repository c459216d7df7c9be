#pragma once

#include "mcp-cancel.hpp"
#include "mcp-error.hpp"
#include "mcp-params.hpp"
#include "mcp-session.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp {

using json = nlohmann::ordered_json;

enum class client_state {
    uninitialized,
    initializing,
    ready,
};

const char * client_state_name(client_state state);

struct implementation {
    std::string name;
    std::string version;
};

// what the server declared in its initialize result
struct server_info {
    std::string                protocol_version;
    implementation             server;
    json                       capabilities = json::object();
    std::optional<std::string> instructions;
};

struct tool {
    std::string                name;
    std::optional<std::string> description;
    json                       input_schema = json::object();
};

struct resource {
    std::string                uri;
    std::string                name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct call_tool_result {
    json content  = json::array();
    bool is_error = false;
};

template <typename T>
struct page {
    std::vector<T>             items;
    std::optional<std::string> next_cursor; // absent on the last page
};

/**
 * Client side of the protocol on top of a Session.
 *
 * initialize() must succeed before any other operation: until then they throw
 * NotInitializedError without touching the transport.
 */
class Client {
public:
    explicit Client(std::unique_ptr<Session> session, const mcp_client_params & params = {});
    ~Client();

    Client(const Client &) = delete;
    Client & operator=(const Client &) = delete;

    // spawn the server process and wrap it in a started session
    static std::unique_ptr<Client> spawn(const std::string & command,
                                         const std::vector<std::string> & args = {},
                                         const mcp_client_params & params = {},
                                         const CancelToken & parent = CancelToken());

    // handshake, then notifications/initialized; calling it again repeats the handshake
    server_info initialize(const call_options & opts = call_options());

    void ping(const call_options & opts = call_options());

    page<tool>     list_tools    (const std::optional<std::string> & cursor = std::nullopt, const call_options & opts = call_options());
    page<resource> list_resources(const std::optional<std::string> & cursor = std::nullopt, const call_options & opts = call_options());

    std::vector<tool>     list_all_tools    (const call_options & opts = call_options());
    std::vector<resource> list_all_resources(const call_options & opts = call_options());

    // the contents array of the resource
    json read_resource(const std::string & uri, const call_options & opts = call_options());

    call_tool_result call_tool(const std::string & name, const json & arguments = json::object(),
                               const call_options & opts = call_options());

    void close();

    client_state state() const { return state_; }
    bool is_ready() const { return state_ == client_state::ready; }

    // a copy of what the last successful initialize() returned
    server_info info() const;

    Session & session() { return *session_; }

private:
    void ensure_ready(const char * method) const;

    std::unique_ptr<Session> session_;
    mcp_client_params        params_;

    std::atomic<client_state> state_;

    mutable std::mutex info_mtx_;
    server_info        server_info_;
};

/**
 * Fetch every page of a cursor-paginated listing.
 *
 * fetch is called with the cursor of the previous page (std::nullopt first) and the loop
 * stops at the first page without a next cursor. There is no bound on the number of pages,
 * cancel is checked before every request.
 */
template <typename T>
std::vector<T> fetch_all(const std::function<page<T>(const std::optional<std::string> &)> & fetch,
                         const CancelToken & cancel = CancelToken()) {
    std::vector<T> items;
    std::optional<std::string> cursor;

    for (;;) {
        if (cancel.cancelled()) {
            throw CancellationError(cancel.reason());
        }

        page<T> p = fetch(cursor);
        items.insert(items.end(),
                std::make_move_iterator(p.items.begin()),
                std::make_move_iterator(p.items.end()));

        if (!p.next_cursor) {
            break;
        }
        cursor = std::move(p.next_cursor);
    }

    return items;
}

tool     tool_from_json    (const json & j);
resource resource_from_json(const json & j);

} // namespace mcp
