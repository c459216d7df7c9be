// Minimal server used by the process tests: speaks the protocol over its own stdin/stdout.

#include "mcp/mcp-error.hpp"
#include "mcp/mcp-log.hpp"
#include "mcp/mcp-session.hpp"
#include "mcp/stdio-transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

using json = mcp::json;

namespace {

struct stub_params {
    bool quiet   = false; // no diagnostics on stderr
    bool verbose = false;
};

void stub_print_usage(int /*argc*/, char ** argv) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", argv[0]);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h, --help     show this help message and exit\n");
    fprintf(stderr, "  -q, --quiet    do not write diagnostics to stderr\n");
    fprintf(stderr, "  -v, --verbose  debug logging\n");
    fprintf(stderr, "\n");
}

bool stub_params_parse(int argc, char ** argv, stub_params & params) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            stub_print_usage(argc, argv);
            exit(0);
        }
        else if (arg == "-q" || arg == "--quiet")   { params.quiet   = true; }
        else if (arg == "-v" || arg == "--verbose") { params.verbose = true; }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            stub_print_usage(argc, argv);
            return false;
        }
    }
    return true;
}

json text_content(const std::string & text) {
    return json::array({ {{"type", "text"}, {"text", text}} });
}

json tool_entry(const std::string & name, const std::string & description) {
    return {
        {"name",        name},
        {"description", description},
        {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}
    };
}

struct stub_state {
    std::atomic<int>  n_initialized{0};
    std::atomic<bool> initialize_seen{false};
    std::atomic<bool> initialized_early{false};
};

json handle_initialize(stub_state & state, const json & params) {
    if (!params.is_object() || !params.contains("protocolVersion")) {
        throw mcp::CallError(mcp::ERROR_INVALID_PARAMS, "missing protocolVersion");
    }
    state.initialize_seen = true;

    return {
        {"protocolVersion", "2024-11-05"},
        {"serverInfo", {
            {"name",    "mcp-stub-server"},
            {"version", "1.0.0"}
        }},
        {"capabilities", {
            {"tools",     json::object()},
            {"resources", json::object()}
        }},
        {"instructions", "test server"}
    };
}

json handle_tools_list(const json & params) {
    const bool second_page = params.is_object() && params.value("cursor", "") == "page2";

    if (!second_page) {
        return {
            {"tools", json::array({
                tool_entry("echo",  "returns its text argument"),
                tool_entry("crash", "exits without answering"),
            })},
            {"nextCursor", "page2"}
        };
    }

    return {
        {"tools", json::array({
            tool_entry("hang",  "never answers"),
            tool_entry("stats", "reports what the server has seen"),
            tool_entry("fail",  "answers with an error"),
        })}
    };
}

json handle_tools_call(stub_state & state, const json & params) {
    if (!params.is_object() || !params.contains("name")) {
        throw mcp::CallError(mcp::ERROR_INVALID_PARAMS, "missing tool name");
    }

    const std::string name = params.at("name").get<std::string>();
    const json arguments   = params.value("arguments", json::object());

    if (name == "echo") {
        return {{"content", text_content(arguments.value("text", ""))}, {"isError", false}};
    }
    if (name == "crash") {
        fflush(stderr);
        _exit(3);
    }
    if (name == "hang") {
        for (;;) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    if (name == "stats") {
        const json stats = {
            {"initialized",       state.n_initialized.load()},
            {"initialized_early", state.initialized_early.load()}
        };
        return {{"content", text_content(stats.dump())}, {"isError", false}};
    }
    if (name == "fail") {
        throw mcp::CallError(mcp::ERROR_INVALID_PARAMS, "tool failed on purpose", {{"tool", name}});
    }

    throw mcp::CallError(mcp::ERROR_INVALID_PARAMS, "unknown tool: " + name);
}

} // namespace

int main(int argc, char ** argv) {
    stub_params params;
    if (!stub_params_parse(argc, argv, params)) {
        return 1;
    }

    mcp_log_set_level(params.verbose ? MCP_LOG_LEVEL_DEBUG : MCP_LOG_LEVEL_WARN);

    if (!params.quiet) {
        fprintf(stderr, "error: simulated failure\n");
        fprintf(stderr, "stub server ready\n");
        fflush(stderr);
    }

    mcp::mcp_session_params sparams;
    sparams.send_exit_on_close = false;

    stub_state state;

    mcp::Session session(std::unique_ptr<mcp::Transport>(new mcp::StdioTransport()), sparams);

    session.set_request_handler("initialize", [&state](const json & p) {
        return handle_initialize(state, p);
    });
    session.set_request_handler("ping", [](const json &) {
        return json::object();
    });
    session.set_request_handler("tools/list", [](const json & p) {
        return handle_tools_list(p);
    });
    session.set_request_handler("tools/call", [&state](const json & p) {
        return handle_tools_call(state, p);
    });
    session.set_request_handler("resources/list", [](const json &) {
        return json{
            {"resources", json::array({
                {{"uri", "stub://hello"}, {"name", "hello"}, {"mimeType", "text/plain"}}
            })}
        };
    });
    session.set_request_handler("resources/read", [](const json & p) {
        const std::string uri = p.value("uri", "");
        if (uri != "stub://hello") {
            throw mcp::CallError(mcp::ERROR_INVALID_PARAMS, "unknown resource: " + uri);
        }
        return json{
            {"contents", json::array({
                {{"uri", uri}, {"mimeType", "text/plain"}, {"text", "hello"}}
            })}
        };
    });

    session.set_notification_handler("notifications/initialized", [&state](const json &) {
        if (!state.initialize_seen) {
            state.initialized_early = true;
        }
        state.n_initialized++;
    });

    session.start();
    session.wait_closed();
    session.close();

    return 0;
}
