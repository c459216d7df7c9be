#include "mcp/mcp-client.hpp"
#include "mcp/mcp-log.hpp"

namespace mcp {

const char * client_state_name(client_state state) {
    switch (state) {
        case client_state::uninitialized: return "uninitialized";
        case client_state::initializing:  return "initializing";
        case client_state::ready:         return "ready";
    }
    return "unknown";
}

static std::optional<std::string> optional_string(const json & j, const char * key) {
    if (j.contains(key) && j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

static std::string string_or_empty(const json & j, const char * key) {
    return optional_string(j, key).value_or("");
}

tool tool_from_json(const json & j) {
    tool t;
    t.name        = string_or_empty(j, "name");
    t.description = optional_string(j, "description");
    if (j.contains("inputSchema") && j.at("inputSchema").is_object()) {
        t.input_schema = j.at("inputSchema");
    }
    return t;
}

resource resource_from_json(const json & j) {
    resource r;
    r.uri         = string_or_empty(j, "uri");
    r.name        = string_or_empty(j, "name");
    r.description = optional_string(j, "description");
    r.mime_type   = optional_string(j, "mimeType");
    return r;
}

static json list_params(const std::optional<std::string> & cursor) {
    if (!cursor) {
        return nullptr;
    }
    return json{{"cursor", *cursor}};
}

Client::Client(std::unique_ptr<Session> session, const mcp_client_params & params)
    : session_(std::move(session)), params_(params), state_(client_state::uninitialized) {
}

Client::~Client() {
    close();
}

std::unique_ptr<Client> Client::spawn(const std::string & command,
                                      const std::vector<std::string> & args,
                                      const mcp_client_params & params,
                                      const CancelToken & parent) {
    return std::unique_ptr<Client>(new Client(Session::spawn(command, args, params.session, parent), params));
}

void Client::ensure_ready(const char * method) const {
    if (state_ != client_state::ready) {
        throw NotInitializedError(method);
    }
}

server_info Client::initialize(const call_options & opts) {
    state_ = client_state::initializing;

    json params = {
        {"protocolVersion", params_.protocol_version},
        {"capabilities",    params_.capabilities},
        {"clientInfo", {
            {"name",    params_.client_name},
            {"version", params_.client_version}
        }}
    };

    MCP_LOG_DEBUG("%s: sending initialize request\n", __func__);

    json result;
    try {
        result = session_->call("initialize", params, opts);
    } catch (const Error & e) {
        state_ = client_state::uninitialized;
        MCP_LOG_ERROR("%s: initialize failed: %s\n", __func__, e.what());
        throw;
    }

    server_info info;
    if (result.is_object()) {
        info.protocol_version = string_or_empty(result, "protocolVersion");
        if (result.contains("serverInfo") && result.at("serverInfo").is_object()) {
            info.server.name    = string_or_empty(result.at("serverInfo"), "name");
            info.server.version = string_or_empty(result.at("serverInfo"), "version");
        }
        if (result.contains("capabilities") && result.at("capabilities").is_object()) {
            info.capabilities = result.at("capabilities");
        }
        info.instructions = optional_string(result, "instructions");
    }

    {
        std::lock_guard<std::mutex> lock(info_mtx_);
        server_info_ = info;
    }
    state_ = client_state::ready;

    MCP_LOG_INFO("%s: server initialized: %s %s (protocol %s)\n", __func__,
            info.server.name.c_str(), info.server.version.c_str(), info.protocol_version.c_str());
    if (info.instructions) {
        MCP_LOG_DEBUG("%s: server instructions: %s\n", __func__, info.instructions->c_str());
    }
    for (const auto & cap : info.capabilities.items()) {
        MCP_LOG_DEBUG("%s: server capability %s: %s\n", __func__, cap.key().c_str(), cap.value().dump().c_str());
    }

    // only after the initialize response, never before
    try {
        session_->notify("notifications/initialized");
    } catch (const Error & e) {
        state_ = client_state::uninitialized;
        MCP_LOG_ERROR("%s: failed to send initialized notification: %s\n", __func__, e.what());
        throw;
    }

    return info;
}

server_info Client::info() const {
    std::lock_guard<std::mutex> lock(info_mtx_);
    return server_info_;
}

void Client::ping(const call_options & opts) {
    ensure_ready("ping");
    session_->call("ping", nullptr, opts);
}

page<tool> Client::list_tools(const std::optional<std::string> & cursor, const call_options & opts) {
    ensure_ready("tools/list");

    const json result = session_->call("tools/list", list_params(cursor), opts);

    page<tool> p;
    if (result.contains("tools") && result.at("tools").is_array()) {
        for (const auto & t : result.at("tools")) {
            p.items.push_back(tool_from_json(t));
        }
    }
    p.next_cursor = optional_string(result, "nextCursor");
    return p;
}

page<resource> Client::list_resources(const std::optional<std::string> & cursor, const call_options & opts) {
    ensure_ready("resources/list");

    const json result = session_->call("resources/list", list_params(cursor), opts);

    page<resource> p;
    if (result.contains("resources") && result.at("resources").is_array()) {
        for (const auto & r : result.at("resources")) {
            p.items.push_back(resource_from_json(r));
        }
    }
    p.next_cursor = optional_string(result, "nextCursor");
    return p;
}

std::vector<tool> Client::list_all_tools(const call_options & opts) {
    return fetch_all<tool>([&](const std::optional<std::string> & cursor) {
        return list_tools(cursor, opts);
    }, opts.cancel);
}

std::vector<resource> Client::list_all_resources(const call_options & opts) {
    return fetch_all<resource>([&](const std::optional<std::string> & cursor) {
        return list_resources(cursor, opts);
    }, opts.cancel);
}

json Client::read_resource(const std::string & uri, const call_options & opts) {
    ensure_ready("resources/read");

    const json result = session_->call("resources/read", {{"uri", uri}}, opts);

    if (result.contains("contents") && result.at("contents").is_array()) {
        return result.at("contents");
    }
    return json::array();
}

call_tool_result Client::call_tool(const std::string & name, const json & arguments, const call_options & opts) {
    ensure_ready("tools/call");

    json params = {
        {"name",      name},
        {"arguments", arguments}
    };

    const json result = session_->call("tools/call", params, opts);

    call_tool_result r;
    if (result.contains("content") && result.at("content").is_array()) {
        r.content = result.at("content");
    }
    if (result.contains("isError") && result.at("isError").is_boolean()) {
        r.is_error = result.at("isError").get<bool>();
    }
    return r;
}

void Client::close() {
    state_ = client_state::uninitialized;
    if (session_) {
        session_->close();
    }
}

} // namespace mcp
